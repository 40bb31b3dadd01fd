#include "treemodel.h"
#include <QDebug>
#include <QSize>

namespace otv {

TreeItemModelBase::TreeItemModelBase(std::unique_ptr<TreeItem> root, int childLimit,
                                     int headerHeight, QObject* parent)
    : QAbstractItemModel(parent)
    , m_root(std::move(root))
    , m_childLimit(childLimit)
    , m_headerHeight(headerHeight)
{
    if (m_childLimit < 1) {
        qWarning() << "TreeItemModel: Child limit" << m_childLimit << "out of range, using 1";
        m_childLimit = 1;
    }
}

TreeItemModelBase::~TreeItemModelBase() = default;

TreeItem* TreeItemModelBase::itemFromIndex(const QModelIndex& index) const {
    if (!index.isValid())
        return m_root.get();
    return static_cast<TreeItem*>(index.internalPointer());
}

QModelIndex TreeItemModelBase::indexFromItem(const TreeItem* item) const {
    if (!item || item == m_root.get())
        return QModelIndex();
    return createIndex(item->row(), item->column(), const_cast<TreeItem*>(item));
}

QModelIndex TreeItemModelBase::index(int row, int column, const QModelIndex& parent) const {
    if (!hasIndex(row, column, parent))
        return QModelIndex();
    TreeItem* child = itemFromIndex(parent)->child(row, column);
    if (!child)
        return QModelIndex();
    return createIndex(row, column, child);
}

QModelIndex TreeItemModelBase::parent(const QModelIndex& index) const {
    if (!index.isValid())
        return QModelIndex();
    return indexFromItem(itemFromIndex(index)->parent());
}

int TreeItemModelBase::rowCount(const QModelIndex& parent) const {
    return itemFromIndex(parent)->childRowCount();
}

int TreeItemModelBase::columnCount(const QModelIndex&) const {
    return columnTotal();
}

bool TreeItemModelBase::hasChildren(const QModelIndex& parent) const {
    return itemFromIndex(parent)->hasChildren();
}

QVariant TreeItemModelBase::data(const QModelIndex& index, int role) const {
    if (!index.isValid())
        return QVariant();
    return itemFromIndex(index)->roleData(role);
}

QVariant TreeItemModelBase::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation != Qt::Horizontal || section < 0 || section >= columnTotal())
        return QVariant();
    if (role == Qt::DisplayRole)
        return columnHeading(section);
    if (role == Qt::SizeHintRole)
        return QSize(columnWidth(section), m_headerHeight);
    return QVariant();
}

Qt::ItemFlags TreeItemModelBase::flags(const QModelIndex& index) const {
    if (!index.isValid())
        return Qt::NoItemFlags;
    return itemFromIndex(index)->flags();
}

bool TreeItemModelBase::setData(const QModelIndex& index, const QVariant& value, int role) {
    if (!index.isValid() || role != Qt::EditRole)
        return false;
    // A blank field means the user just clicked off the editor.
    const QString text = value.toString();
    if (text.isEmpty())
        return false;
    TreeItem* item = itemFromIndex(index);
    if (item->edit(text)) {
        // Rebuilds the row, which destroys `item`.
        expand(parent(index));
    } else {
        emit dataChanged(index, index, {Qt::ForegroundRole});
    }
    // Either the value or the color changed.
    return true;
}

bool TreeItemModelBase::deleteItem(const QModelIndex& index) {
    if (!index.isValid())
        return false;
    TreeItem* item = itemFromIndex(index);
    if (!item->remove()) {
        emit dataChanged(index, index, {Qt::ForegroundRole});
        return false;
    }
    expand(parent(index));
    return true;
}

void TreeItemModelBase::expand(const QModelIndex& index) {
    TreeItem* item = itemFromIndex(index);
    if (const int oldRows = item->childRowCount(); oldRows > 0) {
        beginRemoveRows(index, 0, oldRows - 1);
        item->clearChildRows();
        endRemoveRows();
    }
    std::vector<TreeItem::Row> rows = generateChildRows(item, m_childLimit);
    if (rows.empty())
        return;
    beginInsertRows(index, 0, static_cast<int>(rows.size()) - 1);
    for (auto& row : rows)
        item->appendChildRow(std::move(row));
    endInsertRows();
}

void TreeItemModelBase::refresh(const QModelIndex& index) {
    expand(index.isValid() ? parent(index) : QModelIndex());
}

} // namespace otv
