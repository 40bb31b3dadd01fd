#include "treeitem.h"
#include <QDebug>
#include <exception>

namespace otv {

Qt::ItemFlags TreeItem::flags() const {
    Qt::ItemFlags f = Qt::ItemIsSelectable | Qt::ItemIsEnabled;
    if (m_editCb)
        f |= Qt::ItemIsEditable;
    return f;
}

bool TreeItem::edit(const QString& newValue) {
    if (!m_editCb) {
        editFailed();
        return false;
    }
    try {
        m_editCb(newValue);
        return true;
    } catch (const std::exception& e) {
        qWarning() << "TreeItem: Edit failed:" << e.what();
        editFailed();
        return false;
    }
}

bool TreeItem::remove() {
    if (!m_deleteCb) {
        editFailed();
        return false;
    }
    try {
        m_deleteCb();
        return true;
    } catch (const std::exception& e) {
        qWarning() << "TreeItem: Delete failed:" << e.what();
        editFailed();
        return false;
    }
}

// The item stays red until its parent is re-expanded and the row is rebuilt.
void TreeItem::editFailed() {
    setColor(kFailedRed, 0, 0);
}

void TreeItem::setText(const QString& text) {
    m_roles[Qt::DisplayRole] = text;
}

void TreeItem::setColor(int r, int g, int b) {
    m_roles[Qt::ForegroundRole] = QColor(r, g, b);
}

void TreeItem::setTooltip(const QString& tooltip) {
    m_roles[Qt::ToolTipRole] = QStringLiteral("<pre>%1</pre>").arg(tooltip.toHtmlEscaped());
}

void TreeItem::setIcon(const QIcon& icon) {
    m_roles[Qt::DecorationRole] = icon;
}

TreeItem* TreeItem::child(int row, int column) const {
    if (row < 0 || row >= childRowCount())
        return nullptr;
    const Row& r = m_childRows[row];
    if (column < 0 || column >= static_cast<int>(r.size()))
        return nullptr;
    return r[column].get();
}

void TreeItem::appendChildRow(Row row) {
    const int rowIdx = childRowCount();
    for (int col = 0; col < static_cast<int>(row.size()); ++col) {
        row[col]->m_parent = this;
        row[col]->m_row    = rowIdx;
        row[col]->m_column = col;
    }
    m_childRows.push_back(std::move(row));
}

} // namespace otv
