#pragma once
#include "introspect/iconset.h"
#include "introspect/objectref.h"
#include "treecolumn.h"
#include "treemodel.h"
#include "treeoptions.h"
#include <QVector>
#include <memory>

class QObject;

namespace otv {

using ObjectTreeModel = TreeItemModel<ObjectRef>;

// Key, category icon and children. Deleting a row goes through this column.
class NameColumn : public TreeColumn<ObjectRef> {
public:
    explicit NameColumn(std::shared_ptr<IconSet> icons)
        : TreeColumn(QStringLiteral("Name"), 200), m_icons(std::move(icons)) {}

protected:
    void formatItem(DataTreeItem<ObjectRef>& item, const ObjectRef& ref) const override;

private:
    std::shared_ptr<IconSet> m_icons;
};

class TypeColumn : public TreeColumn<ObjectRef> {
public:
    TypeColumn() : TreeColumn(QStringLiteral("Type"), 150) {}

protected:
    void formatItem(DataTreeItem<ObjectRef>& item, const ObjectRef& ref) const override;
};

// Display text of the value; editable when the ref has a setter.
class ValueColumn : public TreeColumn<ObjectRef> {
public:
    static constexpr int kMaxTextLength = 200;

    ValueColumn() : TreeColumn(QStringLiteral("Value")) {}

protected:
    void formatItem(DataTreeItem<ObjectRef>& item, const ObjectRef& ref) const override;
};

ObjectTreeModel::Columns objectColumns(std::shared_ptr<IconSet> icons);

std::unique_ptr<ObjectTreeModel> makeObjectTreeModel(const QVector<ObjectRef>& roots,
                                                     const TreeOptions& options,
                                                     std::shared_ptr<IconSet> icons = nullptr,
                                                     QObject* parent = nullptr);

} // namespace otv
