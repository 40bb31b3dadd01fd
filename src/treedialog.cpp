#include "treedialog.h"
#include <QAction>
#include <QHeaderView>
#include <QSettings>
#include <QSize>
#include <QTreeView>
#include <QVBoxLayout>

namespace otv {

TreeDialog::TreeDialog(const TreeOptions& options, QWidget* parent, Qt::WindowFlags flags)
    : QDialog(parent, flags)
{
    setWindowTitle("Object Tree View");
    setMinimumSize(600, 450);

    m_view = new QTreeView(this);
    m_view->setObjectName("objectTree");
    m_view->setFont(options.font());
    m_view->setUniformRowHeights(true);
    m_view->setContextMenuPolicy(Qt::ActionsContextMenu);

    m_refreshAction = new QAction("&Refresh", m_view);
    m_refreshAction->setShortcut(QKeySequence::Refresh);
    m_refreshAction->setShortcutContext(Qt::WidgetShortcut);
    connect(m_refreshAction, &QAction::triggered, this, &TreeDialog::refreshCurrent);
    m_view->addAction(m_refreshAction);

    m_deleteAction = new QAction("&Delete", m_view);
    m_deleteAction->setShortcut(QKeySequence::Delete);
    m_deleteAction->setShortcutContext(Qt::WidgetShortcut);
    connect(m_deleteAction, &QAction::triggered, this, &TreeDialog::deleteCurrent);
    m_view->addAction(m_deleteAction);

    auto* layout = new QVBoxLayout(this);
    layout->addWidget(m_view);
}

void TreeDialog::setModel(TreeItemModelBase* model) {
    m_model = model;
    model->expand();
    m_view->setModel(model);
    connect(m_view, &QTreeView::expanded, model, &TreeItemModelBase::expand);

    QHeaderView* header = m_view->header();
    for (int i = 0; i < header->count(); ++i) {
        const QSize hint = model->headerData(i, Qt::Horizontal, Qt::SizeHintRole).toSize();
        if (hint.width() > 0)
            header->resizeSection(i, hint.width());
    }
}

// Deletion always targets the first column, which carries the delete callback.
void TreeDialog::deleteCurrent() {
    if (!m_model)
        return;
    const QModelIndex current = m_view->currentIndex();
    if (current.isValid())
        m_model->deleteItem(current.siblingAtColumn(0));
}

void TreeDialog::refreshCurrent() {
    if (m_model)
        m_model->refresh(m_view->currentIndex());
}

void TreeDialog::restoreSettings() {
    QSettings settings("objtree", "objtree");
    restoreGeometry(settings.value("dialog/geometry").toByteArray());
}

void TreeDialog::saveSettings() const {
    QSettings settings("objtree", "objtree");
    settings.setValue("dialog/geometry", saveGeometry());
}

void TreeDialog::done(int result) {
    saveSettings();
    QDialog::done(result);
}

} // namespace otv
