#include <QtTest/QTest>
#include <QImage>
#include "svgiconrenderer.h"

using namespace otv;

static const char kSquare[] =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"16\" height=\"16\" viewBox=\"0 0 16 16\">"
    "<rect x=\"4\" y=\"4\" width=\"8\" height=\"8\" fill=\"#ff0000\"/></svg>";

static const char kWide[] =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 32 8\">"
    "<rect width=\"32\" height=\"8\" fill=\"#00ff00\"/></svg>";

static const char kSizedOnly[] =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"24\" height=\"12\">"
    "<rect width=\"24\" height=\"12\" fill=\"#0000ff\"/></svg>";

static const char kSizeless[] =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"0\" height=\"0\"/>";

class TestSvgIconRenderer : public QObject {
    Q_OBJECT
private slots:

    void defaults() {
        SvgIconRenderer r;
        QCOMPARE(r.background(), QColor(255, 255, 255, 0));
        QVERIFY(r.renderHints().testFlag(QPainter::Antialiasing));
        QVERIFY(r.renderHints().testFlag(QPainter::SmoothPixmapTransform));
        QCOMPARE(r.cacheSize(), 0);
    }

    void iconSizeFollowsViewBox() {
        SvgIconRenderer r;
        QIcon square = r.render(QByteArray(kSquare));
        QVERIFY(!square.isNull());
        QVERIFY(square.availableSizes().contains(QSize(16, 16)));

        QIcon wide = r.render(QByteArray(kWide));
        QVERIFY(wide.availableSizes().contains(QSize(32, 8)));
    }

    void missingViewBoxFallsBackToDocumentSize() {
        SvgIconRenderer r;
        QIcon icon = r.render(QByteArray(kSizedOnly));
        QVERIFY(!icon.isNull());
        QVERIFY(icon.availableSizes().contains(QSize(24, 12)));
    }

    void sizelessSvgGivesCachedNullIcon() {
        SvgIconRenderer r;
        QVERIFY(r.render(QByteArray(kSizeless)).isNull());
        QVERIFY(r.render(QByteArray(kSizeless)).isNull());
        QCOMPARE(r.cacheSize(), 1);
    }

    void repeatedDataHitsCache() {
        SvgIconRenderer r;
        QIcon first = r.render(QByteArray(kSquare));
        QIcon second = r.render(QByteArray(kSquare));
        QCOMPARE(first.cacheKey(), second.cacheKey());
        QCOMPARE(r.cacheSize(), 1);

        // Text and bytes with the same content share an entry.
        QIcon fromText = r.render(QString::fromLatin1(kSquare));
        QCOMPARE(fromText.cacheKey(), first.cacheKey());
        QCOMPARE(r.cacheSize(), 1);

        r.render(QByteArray(kWide));
        QCOMPARE(r.cacheSize(), 2);

        r.clear();
        QCOMPARE(r.cacheSize(), 0);
    }

    void invalidDataGivesNullIcon() {
        SvgIconRenderer r;
        QVERIFY(r.render(QByteArray("not an svg")).isNull());
        QVERIFY(r.render(QByteArray("not an svg")).isNull());
        QCOMPARE(r.cacheSize(), 1);
    }

    void backgroundFillsUnpaintedPixels() {
        SvgIconRenderer r(QColor(0, 0, 255));
        const QImage im = r.render(QByteArray(kSquare)).pixmap(16, 16).toImage();
        QCOMPARE(im.size(), QSize(16, 16));
        QCOMPARE(im.pixelColor(0, 0), QColor(0, 0, 255));
        QCOMPARE(im.pixelColor(8, 8), QColor(255, 0, 0));
    }

    void defaultBackgroundIsTransparent() {
        SvgIconRenderer r;
        const QImage im = r.render(QByteArray(kSquare)).pixmap(16, 16).toImage();
        QCOMPARE(im.pixelColor(0, 0).alpha(), 0);
        QCOMPARE(im.pixelColor(8, 8).alpha(), 255);
    }
};

QTEST_MAIN(TestSvgIconRenderer)
#include "test_svgiconrenderer.moc"
