// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "arrange/algorithms/AdaptiveLayouts.h"
#include "arrange/algorithms/BasicLayouts.h"
#include "core/geometryutils.h"

using namespace PlasmaArrange;

class TestAdaptiveLayouts : public QObject
{
    Q_OBJECT

private:
    static QRectF screen()
    {
        return QRectF(0, 0, 1920, 1080);
    }

    static QRectF ultrawide()
    {
        return QRectF(0, 0, 3440, 1440);
    }

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Research
    // ═══════════════════════════════════════════════════════════════════════════

    void test_research_quadrants()
    {
        const LayoutResult rects = AdaptiveLayouts::research(4, screen());
        QCOMPARE(rects.size(), 4);
        QCOMPARE(rects[0], QRectF(0, 0, 960, 540));
        QCOMPARE(rects[1], QRectF(960, 0, 960, 540));
        QCOMPARE(rects[2], QRectF(0, 540, 960, 540));
        QCOMPARE(rects[3], QRectF(960, 540, 960, 540));
    }

    void test_research_wrapsAfterFour()
    {
        const LayoutResult rects = AdaptiveLayouts::research(6, screen());
        QCOMPARE(rects.size(), 6);
        QCOMPARE(rects[4], rects[0]);
        QCOMPARE(rects[5], rects[1]);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Multi-task
    // ═══════════════════════════════════════════════════════════════════════════

    void test_multiTask_single()
    {
        const LayoutSettings settings;
        QCOMPARE(AdaptiveLayouts::multiTask(1, screen(), settings), LayoutResult{screen()});
        QVERIFY(AdaptiveLayouts::multiTask(0, screen(), settings).isEmpty());
    }

    void test_multiTask_three()
    {
        const LayoutResult rects = AdaptiveLayouts::multiTask(3, screen(), LayoutSettings());
        QCOMPARE(rects.size(), 3);
        QCOMPARE(rects[0], QRectF(0, 0, 960, 1080));
        QCOMPARE(rects[1], QRectF(960, 0, 960, 540));
        QCOMPARE(rects[2], QRectF(960, 540, 960, 540));
    }

    void test_multiTask_fiveAndSixUseThreeByTwo()
    {
        for (int count : {5, 6}) {
            const LayoutResult rects = AdaptiveLayouts::multiTask(count, screen(), LayoutSettings());
            QCOMPARE(rects.size(), count);
            QCOMPARE(rects[0], QRectF(0, 0, 640, 540));
            QCOMPARE(rects[4], QRectF(640, 540, 640, 540));
        }
    }

    void test_multiTask_manyUsesPaddedGrid()
    {
        LayoutSettings settings;
        settings.padding = 20;
        QCOMPARE(AdaptiveLayouts::multiTask(9, screen(), settings), BasicLayouts::grid(9, screen(), settings));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Ultrawide
    // ═══════════════════════════════════════════════════════════════════════════

    void test_ultraWide_singleCentredColumn()
    {
        const LayoutResult rects = AdaptiveLayouts::ultraWide(1, ultrawide());
        QCOMPARE(rects.size(), 1);
        // Half of 3440 is capped at 1600
        QCOMPARE(rects[0], QRectF(920, 0, 1600, 1440));
    }

    void test_ultraWide_pair()
    {
        const LayoutResult rects = AdaptiveLayouts::ultraWide(2, ultrawide());
        QCOMPARE(rects.size(), 2);
        QCOMPARE(rects[0], QRectF(688, 0, 2064, 1440));
        QCOMPARE(rects[1], QRectF(2580, 0, 860, 1440));
    }

    void test_ultraWide_threeColumns()
    {
        const LayoutResult rects = AdaptiveLayouts::ultraWide(3, ultrawide());
        QCOMPARE(rects.size(), 3);
        QCOMPARE(rects[0], QRectF(860, 0, 1720, 1440));
        QCOMPARE(rects[1], QRectF(0, 0, 860, 1440));
        QCOMPARE(rects[2], QRectF(2580, 0, 860, 1440));
    }

    void test_ultraWide_sideStacks()
    {
        // Five windows: centre, two on the left, two on the right
        const LayoutResult rects = AdaptiveLayouts::ultraWide(5, ultrawide());
        QCOMPARE(rects.size(), 5);
        QCOMPARE(rects[1], QRectF(0, 0, 860, 720));
        QCOMPARE(rects[2], QRectF(0, 720, 860, 720));
        QCOMPARE(rects[3], QRectF(2580, 0, 860, 720));
        QCOMPARE(rects[4], QRectF(2580, 720, 860, 720));

        // Four windows: the extra one goes right
        const LayoutResult four = AdaptiveLayouts::ultraWide(4, ultrawide());
        QCOMPARE(four[1], QRectF(0, 0, 860, 1440));
        QCOMPARE(four[2], QRectF(2580, 0, 860, 720));
        QCOMPARE(four[3], QRectF(2580, 720, 860, 720));
    }

    void test_ultraWide_contained()
    {
        for (int count = 0; count <= 12; ++count) {
            const LayoutResult rects = AdaptiveLayouts::ultraWide(count, ultrawide());
            QCOMPARE(rects.size(), count);
            for (const QRectF &r : rects) {
                QVERIFY(GeometryUtils::contains(ultrawide(), r));
            }
        }
    }
};

QTEST_MAIN(TestAdaptiveLayouts)
#include "test_adaptive_layouts.moc"
