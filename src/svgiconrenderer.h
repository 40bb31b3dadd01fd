#pragma once
#include <QByteArray>
#include <QColor>
#include <QHash>
#include <QIcon>
#include <QPainter>
#include <QString>

namespace otv {

// Renders SVG data onto bitmaps to create QIcons and caches the results,
// keyed by the raw XML bytes that produced them.
class SvgIconRenderer {
public:
    // Default render hints.
    static QPainter::RenderHints highQualityHints() {
        return QPainter::Antialiasing | QPainter::SmoothPixmapTransform;
    }

    // Default background: transparent white.
    static QColor transparentColor() { return QColor(255, 255, 255, 0); }

    explicit SvgIconRenderer(const QColor& background = transparentColor(),
                             QPainter::RenderHints hints = highQualityHints());

    QIcon render(const QByteArray& data);
    QIcon render(const QString& data) { return render(data.toUtf8()); }

    int cacheSize() const { return m_cache.size(); }
    void clear() { m_cache.clear(); }

    QColor background() const { return m_background; }
    QPainter::RenderHints renderHints() const { return m_hints; }

private:
    QIcon renderUncached(const QByteArray& data) const;

    QColor                   m_background;
    QPainter::RenderHints    m_hints;
    QHash<QByteArray, QIcon> m_cache;
};

} // namespace otv
