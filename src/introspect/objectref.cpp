#include "objectref.h"
#include <QDebug>
#include <QMetaObject>
#include <QMetaProperty>
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QVariantHash>
#include <QVariantList>
#include <QVariantMap>
#include <limits>

namespace otv {

// ── Container helpers ──

static QVariantList toVariantList(const QVariant& v) {
    if (v.typeId() == QMetaType::QStringList) {
        QVariantList list;
        for (const QString& s : v.toStringList())
            list.append(s);
        return list;
    }
    return v.toList();
}

static QVariant wrapList(const QVariantList& list, int typeId) {
    if (typeId == QMetaType::QStringList) {
        QStringList strings;
        for (const QVariant& item : list)
            strings.append(item.toString());
        return strings;
    }
    return list;
}

static QVariantMap toVariantMap(const QVariant& v) {
    if (v.typeId() == QMetaType::QVariantHash) {
        QVariantMap map;
        const QVariantHash hash = v.toHash();
        for (auto it = hash.cbegin(); it != hash.cend(); ++it)
            map.insert(it.key(), it.value());
        return map;
    }
    return v.toMap();
}

static QVariant wrapMap(const QVariantMap& map, int typeId) {
    if (typeId == QMetaType::QVariantHash) {
        QVariantHash hash;
        for (auto it = map.cbegin(); it != map.cend(); ++it)
            hash.insert(it.key(), it.value());
        return hash;
    }
    return map;
}

static QObject* requireAlive(const QPointer<QObject>& object) {
    if (!object)
        throw EditError(QStringLiteral("Object has been destroyed"));
    return object.data();
}

// ── Refs ──

ObjectRef objectRef(const QString& key, QObject* object) {
    ObjectRef ref;
    ref.key = key;
    ref.value = QVariant::fromValue(object);
    QPointer<QObject> guard(object);
    ref.getter = [guard]() { return QVariant::fromValue(guard.data()); };
    return ref;
}

ObjectRef valueRef(const QString& key, const QVariant& value) {
    ObjectRef ref;
    ref.key = key;
    ref.value = value;
    return ref;
}

// ── Classification ──

QObject* toObject(const QVariant& value) {
    if (!value.isValid() || !value.metaType().flags().testFlag(QMetaType::PointerToQObject))
        return nullptr;
    return value.value<QObject*>();
}

ValueCategory categorize(const QVariant& value) {
    if (!value.isValid())
        return ValueCategory::Null;
    if (value.metaType().flags().testFlag(QMetaType::PointerToQObject))
        return toObject(value) ? ValueCategory::Object : ValueCategory::Null;
    switch (value.typeId()) {
    case QMetaType::Nullptr:
        return ValueCategory::Null;
    case QMetaType::Bool:
        return ValueCategory::Bool;
    case QMetaType::Int:      case QMetaType::UInt:
    case QMetaType::LongLong: case QMetaType::ULongLong:
    case QMetaType::Long:     case QMetaType::ULong:
    case QMetaType::Short:    case QMetaType::UShort:
    case QMetaType::Char:     case QMetaType::SChar:
    case QMetaType::UChar:
    case QMetaType::Double:   case QMetaType::Float:
        return ValueCategory::Number;
    case QMetaType::QString:
    case QMetaType::QByteArray:
    case QMetaType::QChar:
        return ValueCategory::String;
    case QMetaType::QVariantList:
    case QMetaType::QStringList:
        return ValueCategory::List;
    case QMetaType::QVariantMap:
    case QMetaType::QVariantHash:
        return ValueCategory::Map;
    default:
        return ValueCategory::Other;
    }
}

const char* categoryName(ValueCategory category) {
    switch (category) {
    case ValueCategory::Null:   return "null";
    case ValueCategory::Bool:   return "bool";
    case ValueCategory::Number: return "number";
    case ValueCategory::String: return "string";
    case ValueCategory::List:   return "list";
    case ValueCategory::Map:    return "map";
    case ValueCategory::Object: return "object";
    case ValueCategory::Other:  return "other";
    }
    return "other";
}

QString typeName(const QVariant& value) {
    if (QObject* obj = toObject(value))
        return QString::fromLatin1(obj->metaObject()->className());
    if (!value.isValid())
        return QStringLiteral("invalid");
    const char* name = value.typeName();
    return name ? QString::fromLatin1(name) : QStringLiteral("unknown");
}

QString inheritanceChain(const QObject* object) {
    QStringList names;
    for (const QMetaObject* mo = object ? object->metaObject() : nullptr; mo; mo = mo->superClass())
        names << QString::fromLatin1(mo->className());
    return names.join(QStringLiteral(" : "));
}

int containerSize(const QVariant& value) {
    switch (categorize(value)) {
    case ValueCategory::List: return toVariantList(value).size();
    case ValueCategory::Map:  return toVariantMap(value).size();
    default:                  return 0;
    }
}

static QString quoted(QString s) {
    s.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
    s.replace(QLatin1Char('"'),  QLatin1String("\\\""));
    s.replace(QLatin1Char('\n'), QLatin1String("\\n"));
    s.replace(QLatin1Char('\t'), QLatin1String("\\t"));
    return QLatin1Char('"') + s + QLatin1Char('"');
}

static QString itemCount(int n) {
    return n == 1 ? QStringLiteral("1 item") : QStringLiteral("%1 items").arg(n);
}

QString valueText(const QVariant& value) {
    switch (categorize(value)) {
    case ValueCategory::Null:
        return QStringLiteral("null");
    case ValueCategory::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case ValueCategory::Number:
        return value.toString();
    case ValueCategory::String:
        if (value.typeId() == QMetaType::QByteArray)
            return QLatin1Char('b') + quoted(QString::fromUtf8(value.toByteArray()));
        return quoted(value.toString());
    case ValueCategory::List:
        return QLatin1Char('[') + itemCount(containerSize(value)) + QLatin1Char(']');
    case ValueCategory::Map:
        return QLatin1Char('{') + itemCount(containerSize(value)) + QLatin1Char('}');
    case ValueCategory::Object: {
        QString s;
        QDebug(&s).nospace() << toObject(value);
        return s;
    }
    case ValueCategory::Other:
        break;
    }
    if (value.canConvert<QString>()) {
        const QString s = value.toString();
        if (!s.isEmpty())
            return s;
    }
    QString s;
    QDebug(&s).nospace().noquote() << value;
    return s;
}

// ── Parsing ──

template <typename Int>
static QVariant parseSigned(const QString& text) {
    bool ok = false;
    const qlonglong v = text.trimmed().toLongLong(&ok, 0);
    if (!ok || v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max())
        throw EditError(QStringLiteral("'%1' is not a valid integer").arg(text));
    return QVariant::fromValue(static_cast<Int>(v));
}

template <typename UInt>
static QVariant parseUnsigned(const QString& text) {
    bool ok = false;
    const qulonglong v = text.trimmed().toULongLong(&ok, 0);
    if (!ok || v > std::numeric_limits<UInt>::max())
        throw EditError(QStringLiteral("'%1' is not a valid unsigned integer").arg(text));
    return QVariant::fromValue(static_cast<UInt>(v));
}

QVariant parseValue(const QString& text, const QVariant& current) {
    const ValueCategory cat = categorize(current);
    if (cat == ValueCategory::List || cat == ValueCategory::Map || cat == ValueCategory::Object)
        throw EditError(QStringLiteral("%1 values can't be edited as text").arg(typeName(current)));
    if (!current.isValid())
        return text;

    switch (current.typeId()) {
    case QMetaType::Bool: {
        const QString t = text.trimmed().toLower();
        if (t == QLatin1String("true") || t == QLatin1String("1"))
            return true;
        if (t == QLatin1String("false") || t == QLatin1String("0"))
            return false;
        throw EditError(QStringLiteral("'%1' is not a boolean").arg(text));
    }
    case QMetaType::Char:      return parseSigned<char>(text);
    case QMetaType::SChar:     return parseSigned<signed char>(text);
    case QMetaType::Short:     return parseSigned<short>(text);
    case QMetaType::Int:       return parseSigned<int>(text);
    case QMetaType::Long:      return parseSigned<long>(text);
    case QMetaType::LongLong:  return parseSigned<qlonglong>(text);
    case QMetaType::UChar:     return parseUnsigned<uchar>(text);
    case QMetaType::UShort:    return parseUnsigned<ushort>(text);
    case QMetaType::UInt:      return parseUnsigned<uint>(text);
    case QMetaType::ULong:     return parseUnsigned<ulong>(text);
    case QMetaType::ULongLong: return parseUnsigned<qulonglong>(text);
    case QMetaType::Double: {
        bool ok = false;
        const double d = text.trimmed().toDouble(&ok);
        if (!ok)
            throw EditError(QStringLiteral("'%1' is not a number").arg(text));
        return d;
    }
    case QMetaType::Float: {
        bool ok = false;
        const float f = text.trimmed().toFloat(&ok);
        if (!ok)
            throw EditError(QStringLiteral("'%1' is not a number").arg(text));
        return f;
    }
    case QMetaType::QString:
        return text;
    case QMetaType::QByteArray:
        return text.toUtf8();
    case QMetaType::QChar:
        if (text.size() != 1)
            throw EditError(QStringLiteral("'%1' is not a single character").arg(text));
        return text.at(0);
    default:
        break;
    }

    QVariant converted(text);
    if (!converted.convert(current.metaType()))
        throw EditError(QStringLiteral("Cannot convert '%1' to %2").arg(text, typeName(current)));
    return converted;
}

// ── Child sources ──

namespace {

class QObjectChildSource : public ChildSource<ObjectRef> {
public:
    explicit QObjectChildSource(QObject* object) : m_object(object) {}

    // Live objects always have at least the objectName property.
    bool isEmpty() const override { return m_object.isNull(); }

    // Order: declared properties, dynamic properties, child objects.
    QVector<ObjectRef> take(int limit) const override {
        QVector<ObjectRef> refs;
        QObject* obj = m_object.data();
        if (!obj)
            return refs;
        QPointer<QObject> guard(obj);

        const QMetaObject* mo = obj->metaObject();
        for (int i = 0; i < mo->propertyCount() && refs.size() < limit; ++i) {
            const QMetaProperty prop = mo->property(i);
            if (!prop.isReadable())
                continue;
            const QByteArray name(prop.name());
            ObjectRef ref;
            ref.key = QString::fromLatin1(name);
            ref.value = prop.read(obj);
            ref.getter = [guard, name]() {
                return guard ? guard->property(name.constData()) : QVariant();
            };
            if (prop.isWritable()) {
                ref.setter = [guard, name](const QVariant& v) {
                    if (!requireAlive(guard)->setProperty(name.constData(), v))
                        throw EditError(QStringLiteral("Property %1 rejected the value")
                                            .arg(QString::fromLatin1(name)));
                };
            }
            refs.append(ref);
        }

        const QList<QByteArray> dynamicNames = obj->dynamicPropertyNames();
        for (const QByteArray& name : dynamicNames) {
            if (refs.size() >= limit)
                break;
            if (name.startsWith("_q_"))
                continue;
            ObjectRef ref;
            ref.key = QString::fromLatin1(name);
            ref.value = obj->property(name.constData());
            ref.getter = [guard, name]() {
                return guard ? guard->property(name.constData()) : QVariant();
            };
            // setProperty() returns false for dynamic properties even on success.
            ref.setter = [guard, name](const QVariant& v) {
                requireAlive(guard)->setProperty(name.constData(), v);
            };
            ref.deleter = [guard, name]() {
                requireAlive(guard)->setProperty(name.constData(), QVariant());
            };
            refs.append(ref);
        }

        const QObjectList children = obj->children();
        for (int i = 0; i < children.size() && refs.size() < limit; ++i) {
            QObject* child = children[i];
            const QString key = child->objectName().isEmpty()
                ? QStringLiteral("[%1]").arg(i) : child->objectName();
            ObjectRef ref = objectRef(key, child);
            QPointer<QObject> childGuard(child);
            ref.deleter = [childGuard]() {
                QObject* c = requireAlive(childGuard);
                c->setParent(nullptr);
                c->deleteLater();
            };
            refs.append(ref);
        }
        return refs;
    }

private:
    QPointer<QObject> m_object;
};

class ListChildSource : public ChildSource<ObjectRef> {
public:
    explicit ListChildSource(const ObjectRef& container) : m_container(container) {}

    bool isEmpty() const override { return toVariantList(m_container.current()).isEmpty(); }

    QVector<ObjectRef> take(int limit) const override {
        const QVariant live = m_container.current();
        const QVariantList items = toVariantList(live);
        const int typeId = live.typeId();
        const auto getter = m_container.getter;
        const auto fixed  = m_container.value;
        const auto setter = m_container.setter;
        auto read = [getter, fixed]() { return toVariantList(getter ? getter() : fixed); };

        QVector<ObjectRef> refs;
        for (int i = 0; i < items.size() && refs.size() < limit; ++i) {
            ObjectRef ref;
            ref.key = QStringLiteral("[%1]").arg(i);
            ref.value = items[i];
            if (getter) {
                ref.getter = [read, i]() {
                    const QVariantList list = read();
                    return i < list.size() ? list[i] : QVariant();
                };
            }
            if (setter) {
                ref.setter = [read, setter, typeId, i](const QVariant& v) {
                    QVariantList list = read();
                    if (i >= list.size())
                        throw EditError(QStringLiteral("Index %1 out of range").arg(i));
                    list[i] = v;
                    setter(wrapList(list, typeId));
                };
                ref.deleter = [read, setter, typeId, i]() {
                    QVariantList list = read();
                    if (i >= list.size())
                        throw EditError(QStringLiteral("Index %1 out of range").arg(i));
                    list.removeAt(i);
                    setter(wrapList(list, typeId));
                };
            }
            refs.append(ref);
        }
        return refs;
    }

private:
    ObjectRef m_container;
};

class MapChildSource : public ChildSource<ObjectRef> {
public:
    explicit MapChildSource(const ObjectRef& container) : m_container(container) {}

    bool isEmpty() const override { return toVariantMap(m_container.current()).isEmpty(); }

    QVector<ObjectRef> take(int limit) const override {
        const QVariant live = m_container.current();
        const QVariantMap map = toVariantMap(live);
        const int typeId = live.typeId();
        const auto getter = m_container.getter;
        const auto fixed  = m_container.value;
        const auto setter = m_container.setter;
        auto read = [getter, fixed]() { return toVariantMap(getter ? getter() : fixed); };

        QVector<ObjectRef> refs;
        for (auto it = map.cbegin(); it != map.cend() && refs.size() < limit; ++it) {
            const QString key = it.key();
            ObjectRef ref;
            ref.key = key;
            ref.value = it.value();
            if (getter)
                ref.getter = [read, key]() { return read().value(key); };
            if (setter) {
                ref.setter = [read, setter, typeId, key](const QVariant& v) {
                    QVariantMap m = read();
                    if (!m.contains(key))
                        throw EditError(QStringLiteral("Key %1 no longer exists").arg(key));
                    m[key] = v;
                    setter(wrapMap(m, typeId));
                };
                ref.deleter = [read, setter, typeId, key]() {
                    QVariantMap m = read();
                    if (m.remove(key) == 0)
                        throw EditError(QStringLiteral("Key %1 no longer exists").arg(key));
                    setter(wrapMap(m, typeId));
                };
            }
            refs.append(ref);
        }
        return refs;
    }

private:
    ObjectRef m_container;
};

} // namespace

std::shared_ptr<const ChildSource<ObjectRef>> childrenOf(const ObjectRef& ref) {
    switch (categorize(ref.value)) {
    case ValueCategory::Object: return std::make_shared<QObjectChildSource>(toObject(ref.value));
    case ValueCategory::List:   return std::make_shared<ListChildSource>(ref);
    case ValueCategory::Map:    return std::make_shared<MapChildSource>(ref);
    default:                    return nullptr;
    }
}

} // namespace otv
