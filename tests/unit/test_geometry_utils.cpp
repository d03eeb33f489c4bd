// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRect>
#include <QRectF>
#include <QSizeF>

#include "core/geometryutils.h"
#include "core/types.h"

using namespace PlasmaArrange;

/**
 * @brief Unit tests for the geometry kernel
 *
 * Tests cover:
 * - contains() with epsilon tolerance and zero-area rects
 * - intersection() for overlapping, touching and disjoint rects
 * - clampInto() and translateInto() including oversized rects
 * - centered(), area helpers and edge-consistent snapToRect()
 * - Screen construction from full/usable frames
 */
class TestGeometryUtils : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // contains
    // ═══════════════════════════════════════════════════════════════════════════

    void test_contains_data()
    {
        QTest::addColumn<QRectF>("outer");
        QTest::addColumn<QRectF>("inner");
        QTest::addColumn<bool>("expected");

        const QRectF screen(0, 0, 100, 100);
        QTest::newRow("inside") << screen << QRectF(10, 10, 50, 50) << true;
        QTest::newRow("identical") << screen << screen << true;
        QTest::newRow("overhang right") << screen << QRectF(90, 0, 20, 10) << false;
        QTest::newRow("overhang top") << screen << QRectF(0, -1, 10, 10) << false;
        QTest::newRow("zero area at corner") << screen << QRectF(0, 0, 0, 0) << true;
        QTest::newRow("zero area outside") << screen << QRectF(150, 150, 0, 0) << false;
        QTest::newRow("within epsilon") << screen << QRectF(0, 0, 100.0000001, 100) << true;
    }

    void test_contains()
    {
        QFETCH(QRectF, outer);
        QFETCH(QRectF, inner);
        QFETCH(bool, expected);

        QCOMPARE(GeometryUtils::contains(outer, inner), expected);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // intersection / area
    // ═══════════════════════════════════════════════════════════════════════════

    void test_intersection_overlapping()
    {
        const QRectF result = GeometryUtils::intersection(QRectF(0, 0, 100, 100), QRectF(50, 50, 100, 100));
        QCOMPARE(result, QRectF(50, 50, 50, 50));
    }

    void test_intersection_disjointIsEmpty()
    {
        const QRectF result = GeometryUtils::intersection(QRectF(0, 0, 100, 100), QRectF(200, 200, 10, 10));
        QVERIFY(result.isEmpty());
        QCOMPARE(result, QRectF());
    }

    void test_intersection_touchingEdgesIsEmpty()
    {
        // Right edge is exclusive, so rects sharing an edge do not intersect
        const QRectF result = GeometryUtils::intersection(QRectF(0, 0, 100, 100), QRectF(100, 0, 10, 10));
        QVERIFY(result.isEmpty());
    }

    void test_area_degenerateIsZero()
    {
        QCOMPARE(GeometryUtils::area(QRectF(0, 0, 10, 20)), 200.0);
        QCOMPARE(GeometryUtils::area(QRectF(0, 0, 0, 20)), 0.0);
        QCOMPARE(GeometryUtils::area(QRectF(0, 0, -10, 20)), 0.0);
        QCOMPARE(GeometryUtils::overlapArea(QRectF(0, 0, 10, 10), QRectF(5, 5, 10, 10)), 25.0);
    }

    void test_aspectRatio()
    {
        QVERIFY(qFuzzyCompare(GeometryUtils::aspectRatio(QRectF(0, 0, 1920, 1080)), 16.0 / 9.0));
        QCOMPARE(GeometryUtils::aspectRatio(QRectF(0, 0, 1920, 0)), 0.0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // clampInto / translateInto
    // ═══════════════════════════════════════════════════════════════════════════

    void test_clampInto_data()
    {
        QTest::addColumn<QRectF>("rect");
        QTest::addColumn<QRectF>("expected");

        QTest::newRow("already inside") << QRectF(10, 10, 100, 100) << QRectF(10, 10, 100, 100);
        QTest::newRow("off left") << QRectF(-50, 10, 100, 100) << QRectF(0, 10, 100, 100);
        QTest::newRow("off bottom right") << QRectF(950, 980, 100, 100) << QRectF(900, 900, 100, 100);
        QTest::newRow("too wide") << QRectF(-10, -10, 2000, 50) << QRectF(0, 0, 1000, 50);
        QTest::newRow("too big both") << QRectF(300, 300, 5000, 5000) << QRectF(0, 0, 1000, 1000);
    }

    void test_clampInto()
    {
        QFETCH(QRectF, rect);
        QFETCH(QRectF, expected);

        const QRectF bounds(0, 0, 1000, 1000);
        const QRectF result = GeometryUtils::clampInto(rect, bounds);
        QCOMPARE(result, expected);
        QVERIFY(GeometryUtils::contains(bounds, result));
    }

    void test_translateInto_keepsSize()
    {
        const QRectF bounds(0, 0, 1000, 1000);
        QCOMPARE(GeometryUtils::translateInto(QRectF(900, 900, 200, 200), bounds), QRectF(800, 800, 200, 200));
        QCOMPARE(GeometryUtils::translateInto(QRectF(-20, 40, 200, 200), bounds), QRectF(0, 40, 200, 200));
    }

    void test_translateInto_oversizedAlignsTopLeft()
    {
        const QRectF bounds(100, 100, 1000, 1000);
        QCOMPARE(GeometryUtils::translateInto(QRectF(500, 0, 1500, 100), bounds), QRectF(100, 100, 1500, 100));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // centered / snapToRect
    // ═══════════════════════════════════════════════════════════════════════════

    void test_centered()
    {
        QCOMPARE(GeometryUtils::centered(QSizeF(100, 50), QRectF(0, 0, 200, 100)), QRectF(50, 25, 100, 50));
        QCOMPARE(GeometryUtils::centered(QSizeF(100, 50), QRectF(1000, 0, 200, 100)), QRectF(1050, 25, 100, 50));
    }

    void test_centered_negativeSizeIsZero()
    {
        QCOMPARE(GeometryUtils::centered(QSizeF(-5, -5), QRectF(0, 0, 200, 100)), QRectF(100, 50, 0, 0));
    }

    void test_snapToRect_roundsEdges()
    {
        QCOMPARE(GeometryUtils::snapToRect(QRectF(0.4, 0.6, 99.8, 100.2)), QRect(0, 1, 100, 100));
    }

    void test_snapToRect_adjacentStayAdjacent()
    {
        const qreal third = 100.0 / 3.0;
        const QRect a = GeometryUtils::snapToRect(QRectF(0, 0, third, 10));
        const QRect b = GeometryUtils::snapToRect(QRectF(third, 0, third, 10));
        const QRect c = GeometryUtils::snapToRect(QRectF(2 * third, 0, third, 10));
        QCOMPARE(a.x() + a.width(), b.x());
        QCOMPARE(b.x() + b.width(), c.x());
        QCOMPARE(c.x() + c.width(), 100);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Screen
    // ═══════════════════════════════════════════════════════════════════════════

    void test_screen_usableClippedIntoFull()
    {
        const Screen screen = Screen::fromFrames(QRectF(0, 0, 1920, 1080), QRectF(-10, 25, 1940, 1000));
        QCOMPARE(screen.usableFrame, QRectF(0, 25, 1920, 1000));
        QVERIFY(GeometryUtils::contains(screen.fullFrame, screen.usableFrame));
    }

    void test_screen_disjointUsableCollapses()
    {
        const Screen screen = Screen::fromFrames(QRectF(0, 0, 1920, 1080), QRectF(5000, 0, 100, 100));
        QCOMPARE(screen.usableFrame, QRectF(0, 0, 0, 0));
        QCOMPARE(screen.aspectRatio(), 0.0);
    }

    void test_screen_orientation()
    {
        QVERIFY(Screen::fromGeometry(QRectF(0, 0, 1080, 1920)).isVertical());
        QVERIFY(!Screen::fromGeometry(QRectF(0, 0, 1920, 1080)).isVertical());
        QVERIFY(!Screen::fromGeometry(QRectF(0, 0, 1440, 1440)).isVertical());
    }
};

QTEST_MAIN(TestGeometryUtils)
#include "test_geometry_utils.moc"
