#include "svgiconrenderer.h"
#include <QDebug>
#include <QImage>
#include <QPixmap>
#include <QSvgRenderer>

namespace otv {

SvgIconRenderer::SvgIconRenderer(const QColor& background, QPainter::RenderHints hints)
    : m_background(background), m_hints(hints) {}

QIcon SvgIconRenderer::render(const QByteArray& data) {
    auto it = m_cache.constFind(data);
    if (it != m_cache.constEnd())
        return it.value();
    QIcon icon = renderUncached(data);
    m_cache.insert(data, icon);
    return icon;
}

// Pixel size comes from the viewBox, or the document size when there is none.
QIcon SvgIconRenderer::renderUncached(const QByteArray& data) const {
    QSvgRenderer svg(data);
    if (!svg.isValid()) {
        qWarning() << "SvgIconRenderer: Invalid SVG data," << data.size() << "bytes";
        return QIcon();
    }
    QSize size = svg.viewBox().size();
    if (size.isEmpty())
        size = svg.defaultSize();
    if (size.isEmpty()) {
        qWarning() << "SvgIconRenderer: SVG has no usable size";
        return QIcon();
    }

    QImage im(size, QImage::Format_ARGB32);
    im.fill(m_background);
    {
        QPainter p(&im);
        p.setRenderHints(m_hints);
        svg.render(&p);
    }
    return QIcon(QPixmap::fromImage(im));
}

} // namespace otv
