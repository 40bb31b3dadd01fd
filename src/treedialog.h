#pragma once
#include "treemodel.h"
#include "treeoptions.h"
#include <QDialog>
#include <QPointer>

class QAction;
class QTreeView;

namespace otv {

// Dialog hosting a tree view over a TreeItemModel.
class TreeDialog : public QDialog {
    Q_OBJECT
public:
    static Qt::WindowFlags defaultFlags() {
        return Qt::CustomizeWindowHint | Qt::Dialog
             | Qt::WindowCloseButtonHint | Qt::WindowTitleHint;
    }

    explicit TreeDialog(const TreeOptions& options = TreeOptions(), QWidget* parent = nullptr,
                        Qt::WindowFlags flags = defaultFlags());

    // Populate the top level, attach the model and size the header sections.
    void setModel(TreeItemModelBase* model);

    TreeItemModelBase* model() const { return m_model; }
    QTreeView* view() const { return m_view; }

    void restoreSettings();
    void saveSettings() const;

public slots:
    void deleteCurrent();
    void refreshCurrent();
    void done(int result) override;

private:
    QTreeView*                  m_view          = nullptr;
    QPointer<TreeItemModelBase> m_model;
    QAction*                    m_deleteAction  = nullptr;
    QAction*                    m_refreshAction = nullptr;
};

} // namespace otv
