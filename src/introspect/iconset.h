#pragma once
#include "introspect/objectref.h"
#include "svgiconrenderer.h"
#include <QByteArray>
#include <QIcon>

namespace otv {

// Embedded SVG icons, one per value category, rendered through a shared cache.
class IconSet {
public:
    IconSet();

    QIcon icon(ValueCategory category);
    SvgIconRenderer& renderer() { return m_renderer; }

    static QByteArray svgData(ValueCategory category);
    static QByteArray appIconData();

private:
    SvgIconRenderer m_renderer;
};

} // namespace otv
