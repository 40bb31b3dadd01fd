#pragma once
#include "treecolumn.h"
#include "treeitem.h"
#include <QAbstractItemModel>
#include <QVector>
#include <memory>
#include <vector>

namespace otv {

inline constexpr int kDefaultChildLimit   = 200;
inline constexpr int kDefaultHeaderHeight = 25;

// ── Model base ──

// Item model over a lazily materialized tree of TreeItems. Each index carries
// a pointer to its item; an item lives exactly as long as its row does, so the
// mapping follows the row insert/remove notifications.
class TreeItemModelBase : public QAbstractItemModel {
    Q_OBJECT
public:
    TreeItemModelBase(std::unique_ptr<TreeItem> root, int childLimit, int headerHeight,
                      QObject* parent = nullptr);
    ~TreeItemModelBase() override;

    QModelIndex index(int row, int column, const QModelIndex& parent = QModelIndex()) const override;
    QModelIndex parent(const QModelIndex& index) const override;
    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    bool hasChildren(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    bool setData(const QModelIndex& index, const QVariant& value, int role = Qt::EditRole) override;

    bool deleteItem(const QModelIndex& index);

    TreeItem* itemFromIndex(const QModelIndex& index) const;
    QModelIndex indexFromItem(const TreeItem* item) const;
    TreeItem* rootItem() const { return m_root.get(); }

    int childLimit() const { return m_childLimit; }
    int headerHeight() const { return m_headerHeight; }

public slots:
    // Add (or replace) all child rows of the item at `index`.
    void expand(const QModelIndex& index = QModelIndex());
    // Rebuild the rows next to `index` (the top level when invalid).
    void refresh(const QModelIndex& index = QModelIndex());

protected:
    virtual int columnTotal() const = 0;
    virtual QString columnHeading(int section) const = 0;
    virtual int columnWidth(int section) const = 0;
    virtual std::vector<TreeItem::Row> generateChildRows(const TreeItem* parent, int limit) const = 0;

private:
    std::unique_ptr<TreeItem> m_root;
    int m_childLimit;
    int m_headerHeight;
};

// ── Typed model ──

template <typename T>
class TreeItemModel : public TreeItemModelBase {
public:
    using Column  = TreeColumn<T>;
    using Columns = QVector<std::shared_ptr<const Column>>;

    TreeItemModel(std::unique_ptr<DataTreeItem<T>> root, Columns columns,
                  int childLimit = kDefaultChildLimit, int headerHeight = kDefaultHeaderHeight,
                  QObject* parent = nullptr)
        : TreeItemModelBase(std::move(root), childLimit, headerHeight, parent)
        , m_columns(std::move(columns)) {}

    const Columns& columns() const { return m_columns; }

protected:
    int columnTotal() const override { return m_columns.size(); }
    QString columnHeading(int section) const override { return m_columns[section]->heading(); }
    int columnWidth(int section) const override { return m_columns[section]->width(); }

    std::vector<TreeItem::Row> generateChildRows(const TreeItem* parent, int limit) const override {
        // Every item in this model was built by one of our columns.
        const auto* item = static_cast<const DataTreeItem<T>*>(parent);
        const QVector<T> childData = item->takeChildren(limit);
        std::vector<TreeItem::Row> rows;
        rows.reserve(childData.size());
        for (const T& data : childData) {
            TreeItem::Row row;
            row.reserve(m_columns.size());
            for (const auto& col : m_columns)
                row.push_back(col->generateItem(data));
            rows.push_back(std::move(row));
        }
        return rows;
    }

private:
    Columns m_columns;
};

} // namespace otv
