#pragma once
#include "treeoptions.h"
#include "introspect/objectcolumns.h"
#include <QMainWindow>
#include <QPointer>
#include <memory>

class QLabel;

namespace otv {

class TreeDialog;
class WindowController;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);

    WindowController* controller() const { return m_controller; }
    TreeDialog* treeDialog() const { return m_treeDialog; }

    // Top-level objects listed by the object tree.
    QVector<ObjectRef> inspectionRoots();

public slots:
    void showObjectTree();
    void showOptionsDialog();

private:
    void createMenus();
    void onActivated();

    WindowController*                m_controller  = nullptr;
    QLabel*                          m_statusLabel = nullptr;
    QPointer<TreeDialog>             m_treeDialog;
    std::shared_ptr<IconSet>         m_icons;
    TreeOptions                      m_options;
    int                              m_activations = 0;
};

} // namespace otv
