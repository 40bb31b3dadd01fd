#pragma once
#include <QFont>
#include <QString>

class QSettings;

namespace otv {

struct TreeOptions {
    int     childLimit    = 200;   // max child rows shown per expanded object
    int     headerHeight  = 25;    // column header height, px
    QString fontFamily    = QStringLiteral("Segoe UI");
    int     fontPointSize = 9;

    QFont font() const { return QFont(fontFamily, fontPointSize); }

    static TreeOptions load(QSettings& settings);
    void save(QSettings& settings) const;
};

} // namespace otv
