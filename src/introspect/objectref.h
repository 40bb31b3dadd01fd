#pragma once
#include "treeitem.h"
#include <QString>
#include <QVariant>
#include <functional>
#include <memory>
#include <stdexcept>

class QObject;

namespace otv {

// Thrown by setters, deleters and value parsing when an edit can't be applied.
class EditError : public std::runtime_error {
public:
    explicit EditError(const QString& message)
        : std::runtime_error(message.toStdString()) {}
};

// ── Object reference ──

// One introspected value as seen from its container: a property of a QObject,
// a child object, a list element or a map entry.
struct ObjectRef {
    QString                              key;
    QVariant                             value;    // snapshot taken when the ref was built
    std::function<QVariant()>            getter;   // re-reads the live value (null = fixed)
    std::function<void(const QVariant&)> setter;   // null = read-only
    std::function<void()>                deleter;  // null = can't be removed

    QVariant current() const { return getter ? getter() : value; }
};

ObjectRef objectRef(const QString& key, QObject* object);
ObjectRef valueRef(const QString& key, const QVariant& value);

// ── Value classification ──

enum class ValueCategory { Null, Bool, Number, String, List, Map, Object, Other };

ValueCategory categorize(const QVariant& value);
const char* categoryName(ValueCategory category);

QObject* toObject(const QVariant& value);
QString typeName(const QVariant& value);
QString inheritanceChain(const QObject* object);
QString valueText(const QVariant& value);
int containerSize(const QVariant& value);

// Convert edit text to the type of `current`. Throws EditError.
QVariant parseValue(const QString& text, const QVariant& current);

// Lazily enumerated children of a ref, or null when it has none.
std::shared_ptr<const ChildSource<ObjectRef>> childrenOf(const ObjectRef& ref);

} // namespace otv
