#include "objectcolumns.h"

namespace otv {

void NameColumn::formatItem(DataTreeItem<ObjectRef>& item, const ObjectRef& ref) const {
    item.setText(ref.key);
    item.setTooltip(ref.key + QLatin1Char('\n') + typeName(ref.value));
    if (m_icons)
        item.setIcon(m_icons->icon(categorize(ref.value)));
    item.setChildren(childrenOf(ref));
    if (ref.deleter)
        item.setDeleteCallback(ref.deleter);
}

void TypeColumn::formatItem(DataTreeItem<ObjectRef>& item, const ObjectRef& ref) const {
    const QString name = typeName(ref.value);
    item.setText(name);
    if (QObject* obj = toObject(ref.value))
        item.setTooltip(inheritanceChain(obj));
    else
        item.setTooltip(name);
}

void ValueColumn::formatItem(DataTreeItem<ObjectRef>& item, const ObjectRef& ref) const {
    const QString text = valueText(ref.value);
    if (text.size() > kMaxTextLength)
        item.setText(text.left(kMaxTextLength) + QStringLiteral("..."));
    else
        item.setText(text);
    item.setTooltip(text);
    if (ref.setter) {
        item.setEditCallback([ref](const QString& newValue) {
            ref.setter(parseValue(newValue, ref.current()));
        });
    }
}

ObjectTreeModel::Columns objectColumns(std::shared_ptr<IconSet> icons) {
    return {
        std::make_shared<NameColumn>(std::move(icons)),
        std::make_shared<TypeColumn>(),
        std::make_shared<ValueColumn>(),
    };
}

std::unique_ptr<ObjectTreeModel> makeObjectTreeModel(const QVector<ObjectRef>& roots,
                                                     const TreeOptions& options,
                                                     std::shared_ptr<IconSet> icons,
                                                     QObject* parent) {
    if (!icons)
        icons = std::make_shared<IconSet>();
    auto root = std::make_unique<DataTreeItem<ObjectRef>>();
    root->setChildren(roots);
    return std::make_unique<ObjectTreeModel>(std::move(root), objectColumns(std::move(icons)),
                                             options.childLimit, options.headerHeight, parent);
}

} // namespace otv
