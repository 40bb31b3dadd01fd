#include "treeoptions.h"
#include <QDebug>
#include <QSettings>

namespace otv {

static int clampSetting(const char* key, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        qWarning() << "TreeOptions: Setting" << key << "=" << value << "out of range, clamped";
        return qBound(lo, value, hi);
    }
    return value;
}

TreeOptions TreeOptions::load(QSettings& settings) {
    TreeOptions o;
    settings.beginGroup(QStringLiteral("tree"));
    o.childLimit    = clampSetting("childLimit",
                                   settings.value("childLimit", o.childLimit).toInt(), 1, 100000);
    o.headerHeight  = clampSetting("headerHeight",
                                   settings.value("headerHeight", o.headerHeight).toInt(), 8, 200);
    o.fontFamily    = settings.value("fontFamily", o.fontFamily).toString();
    o.fontPointSize = clampSetting("fontPointSize",
                                   settings.value("fontPointSize", o.fontPointSize).toInt(), 4, 72);
    settings.endGroup();
    return o;
}

void TreeOptions::save(QSettings& settings) const {
    settings.beginGroup(QStringLiteral("tree"));
    settings.setValue("childLimit", childLimit);
    settings.setValue("headerHeight", headerHeight);
    settings.setValue("fontFamily", fontFamily);
    settings.setValue("fontPointSize", fontPointSize);
    settings.endGroup();
}

} // namespace otv
