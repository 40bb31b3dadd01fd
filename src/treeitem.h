#pragma once
#include <QColor>
#include <QHash>
#include <QIcon>
#include <QString>
#include <QVariant>
#include <QVector>
#include <functional>
#include <memory>
#include <vector>

namespace otv {

// ── Child payload source ──

// Ordered collection of child payloads, enumerated on demand.
template <typename T>
class ChildSource {
public:
    virtual ~ChildSource() = default;

    virtual bool isEmpty() const = 0;
    // First `limit` payloads, in order.
    virtual QVector<T> take(int limit) const = 0;
};

template <typename T>
class VectorChildSource : public ChildSource<T> {
public:
    explicit VectorChildSource(QVector<T> items) : m_items(std::move(items)) {}

    bool isEmpty() const override { return m_items.isEmpty(); }
    QVector<T> take(int limit) const override { return m_items.mid(0, limit); }

private:
    QVector<T> m_items;
};

// ── Tree item ──

// A single cell in the tree. Display data lives in the role map; edit and
// delete go through callbacks supplied by the column formatter.
class TreeItem {
public:
    using EditCallback   = std::function<void(const QString&)>;
    using DeleteCallback = std::function<void()>;
    using Row            = std::vector<std::unique_ptr<TreeItem>>;

    TreeItem() = default;
    virtual ~TreeItem() = default;

    TreeItem(const TreeItem&) = delete;
    TreeItem& operator=(const TreeItem&) = delete;

    QVariant roleData(int role) const { return m_roles.value(role); }
    TreeItem* parent() const { return m_parent; }
    int row() const    { return m_row; }
    int column() const { return m_column; }

    Qt::ItemFlags flags() const;
    virtual bool hasChildren() const { return false; }

    bool edit(const QString& newValue);
    bool remove();

    void setText(const QString& text);
    void setColor(int r, int g, int b);
    void setTooltip(const QString& tooltip);
    void setIcon(const QIcon& icon);
    void setEditCallback(EditCallback callback)     { m_editCb = std::move(callback); }
    void setDeleteCallback(DeleteCallback callback) { m_deleteCb = std::move(callback); }

    // Materialized child rows, owned by this item and managed by the model.
    int childRowCount() const { return static_cast<int>(m_childRows.size()); }
    TreeItem* child(int row, int column) const;
    void appendChildRow(Row row);
    void clearChildRows() { m_childRows.clear(); }

    static constexpr int kFailedRed = 192;

private:
    void editFailed();

    TreeItem*            m_parent = nullptr;
    int                  m_row    = 0;
    int                  m_column = 0;
    QHash<int, QVariant> m_roles;
    EditCallback         m_editCb;
    DeleteCallback       m_deleteCb;
    std::vector<Row>     m_childRows;
};

// Tree item carrying a source of typed child payloads.
template <typename T>
class DataTreeItem : public TreeItem {
public:
    bool hasChildren() const override { return m_children && !m_children->isEmpty(); }

    QVector<T> takeChildren(int limit) const {
        return m_children ? m_children->take(limit) : QVector<T>();
    }

    void setChildren(std::shared_ptr<const ChildSource<T>> children) {
        m_children = std::move(children);
    }

    void setChildren(QVector<T> children) {
        m_children = std::make_shared<VectorChildSource<T>>(std::move(children));
    }

private:
    std::shared_ptr<const ChildSource<T>> m_children;
};

} // namespace otv
