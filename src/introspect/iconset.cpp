#include "iconset.h"
#include <QDebug>
#include <QFile>

// Resources compiled into a static library must be registered explicitly.
static void initIconResources() {
    static const bool registered = [] {
        Q_INIT_RESOURCE(objtree);
        return true;
    }();
    Q_UNUSED(registered);
}

namespace otv {

static QByteArray readResource(const QString& path) {
    initIconResources();
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "IconSet: Missing icon resource" << path;
        return QByteArray();
    }
    return f.readAll();
}

IconSet::IconSet() = default;

QIcon IconSet::icon(ValueCategory category) {
    return m_renderer.render(svgData(category));
}

QByteArray IconSet::svgData(ValueCategory category) {
    return readResource(QStringLiteral(":/icons/%1.svg").arg(QLatin1String(categoryName(category))));
}

QByteArray IconSet::appIconData() {
    return readResource(QStringLiteral(":/icons/app.svg"));
}

} // namespace otv
