#pragma once
#include "treeitem.h"
#include <QString>
#include <memory>

namespace otv {

// Formatter for one tree column. Each row of the tree gets one item per
// column, all generated from the same payload.
template <typename T>
class TreeColumn {
public:
    explicit TreeColumn(const QString& heading, int width = 0)
        : m_heading(heading), m_width(width) {}
    virtual ~TreeColumn() = default;

    QString heading() const { return m_heading; }
    int width() const { return m_width; }   // 0 = unspecified

    std::unique_ptr<DataTreeItem<T>> generateItem(const T& data) const {
        auto item = std::make_unique<DataTreeItem<T>>();
        formatItem(*item, data);
        return item;
    }

protected:
    virtual void formatItem(DataTreeItem<T>& item, const T& data) const = 0;

private:
    QString m_heading;
    int     m_width;
};

} // namespace otv
