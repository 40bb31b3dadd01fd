#include <QtTest/QTest>
#include <QPixmap>
#include <stdexcept>
#include "treeitem.h"

using namespace otv;

class TestTreeItem : public QObject {
    Q_OBJECT
private slots:

    // ── Flags ──

    void defaultFlagsAreSelectableAndEnabled() {
        TreeItem item;
        QCOMPARE(item.flags(), Qt::ItemIsSelectable | Qt::ItemIsEnabled);
    }

    void editCallbackMakesItemEditable() {
        TreeItem item;
        item.setEditCallback([](const QString&) {});
        QVERIFY(item.flags() & Qt::ItemIsEditable);
        QVERIFY(item.flags() & Qt::ItemIsSelectable);
    }

    // ── Roles ──

    void textAndColorRoles() {
        TreeItem item;
        item.setText("hello");
        item.setColor(10, 20, 30);
        QCOMPARE(item.roleData(Qt::DisplayRole).toString(), QString("hello"));
        QCOMPARE(item.roleData(Qt::ForegroundRole).value<QColor>(), QColor(10, 20, 30));
        QVERIFY(!item.roleData(Qt::WhatsThisRole).isValid());
    }

    void tooltipIsPreformattedAndEscaped() {
        TreeItem item;
        item.setTooltip("a < b\nline 2");
        QCOMPARE(item.roleData(Qt::ToolTipRole).toString(),
                 QString("<pre>a &lt; b\nline 2</pre>"));
    }

    void iconRole() {
        TreeItem item;
        QPixmap pm(8, 8);
        pm.fill(Qt::blue);
        item.setIcon(QIcon(pm));
        QVERIFY(!item.roleData(Qt::DecorationRole).value<QIcon>().isNull());
    }

    // ── Edit / delete ──

    void editPassesValueToCallback() {
        TreeItem item;
        QString received;
        item.setEditCallback([&](const QString& v) { received = v; });
        QVERIFY(item.edit("42"));
        QCOMPARE(received, QString("42"));
        QVERIFY(!item.roleData(Qt::ForegroundRole).isValid());
    }

    void editWithoutCallbackTurnsRed() {
        TreeItem item;
        QVERIFY(!item.edit("42"));
        QCOMPARE(item.roleData(Qt::ForegroundRole).value<QColor>(), QColor(192, 0, 0));
    }

    void editThatThrowsTurnsRed() {
        TreeItem item;
        item.setEditCallback([](const QString&) { throw std::runtime_error("bad value"); });
        QVERIFY(!item.edit("x"));
        QCOMPARE(item.roleData(Qt::ForegroundRole).value<QColor>(), QColor(192, 0, 0));
    }

    void removeCallsDeleteCallback() {
        TreeItem item;
        int calls = 0;
        item.setDeleteCallback([&]() { ++calls; });
        QVERIFY(item.remove());
        QCOMPARE(calls, 1);
    }

    void removeFailuresTurnRed() {
        TreeItem noCallback;
        QVERIFY(!noCallback.remove());
        QCOMPARE(noCallback.roleData(Qt::ForegroundRole).value<QColor>(), QColor(192, 0, 0));

        TreeItem throwing;
        throwing.setDeleteCallback([]() { throw std::logic_error("read-only container"); });
        QVERIFY(!throwing.remove());
        QCOMPARE(throwing.roleData(Qt::ForegroundRole).value<QColor>(), QColor(192, 0, 0));
    }

    // ── Children ──

    void dataItemChildren() {
        DataTreeItem<int> item;
        QVERIFY(!item.hasChildren());
        QVERIFY(item.takeChildren(10).isEmpty());

        item.setChildren(QVector<int>{1, 2, 3, 4, 5});
        QVERIFY(item.hasChildren());
        QCOMPARE(item.takeChildren(3), (QVector<int>{1, 2, 3}));
        QCOMPARE(item.takeChildren(100).size(), 5);

        item.setChildren(QVector<int>{});
        QVERIFY(!item.hasChildren());
    }

    void appendedRowsKnowTheirPosition() {
        TreeItem parent;
        for (int r = 0; r < 2; ++r) {
            TreeItem::Row row;
            row.push_back(std::make_unique<TreeItem>());
            row.push_back(std::make_unique<TreeItem>());
            parent.appendChildRow(std::move(row));
        }
        QCOMPARE(parent.childRowCount(), 2);
        TreeItem* cell = parent.child(1, 1);
        QVERIFY(cell);
        QCOMPARE(cell->parent(), &parent);
        QCOMPARE(cell->row(), 1);
        QCOMPARE(cell->column(), 1);
        QVERIFY(!parent.child(2, 0));
        QVERIFY(!parent.child(0, 2));
        QVERIFY(!parent.child(-1, 0));

        parent.clearChildRows();
        QCOMPARE(parent.childRowCount(), 0);
    }
};

QTEST_MAIN(TestTreeItem)
#include "test_treeitem.moc"
