// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QLoggingCategory>

#include "arrange/LayoutEngine.h"
#include "arrange/LayoutModeRegistry.h"
#include "arrange/algorithms/BasicLayouts.h"
#include "core/geometryutils.h"

using namespace PlasmaArrange;

/**
 * @brief Properties every layout mode must satisfy through LayoutEngine
 *
 * Runs each mode over window counts 0-50 on landscape, ultrawide, portrait
 * and square screens and checks:
 * - exactly one rect per window
 * - corrected rects inside the usable frame and at least the minimum size
 * - determinism
 * - Focus substitution for ultrawide-aware modes on narrow screens
 * - no overlap for the tiling modes
 */
class TestLayoutProperties : public QObject
{
    Q_OBJECT

private:
    static QVector<Screen> screens()
    {
        return {
            Screen::fromFrames(QRectF(0, 0, 1920, 1080), QRectF(0, 0, 1920, 1040), QStringLiteral("landscape")),
            Screen::fromGeometry(QRectF(1920, 0, 3440, 1440), QStringLiteral("ultrawide")),
            Screen::fromFrames(QRectF(0, 0, 1080, 1920), QRectF(0, 32, 1080, 1888), QStringLiteral("portrait")),
            Screen::fromGeometry(QRectF(-1440, 0, 1440, 1440), QStringLiteral("square")),
        };
    }

    static LayoutRequest request(LayoutMode mode, int count, const Screen &screen)
    {
        LayoutRequest r;
        r.mode = mode;
        r.windowCount = count;
        r.screen = screen;
        return r;
    }

    static QByteArray describe(LayoutMode mode, int count, const Screen &screen)
    {
        return LayoutModeRegistry::modeId(mode).toUtf8() + " n=" + QByteArray::number(count) + " on "
            + screen.name.toUtf8();
    }

    // Modes that partition the screen without overlap
    static bool isTiling(LayoutMode mode)
    {
        switch (mode) {
        case LayoutMode::Cascade:
        case LayoutMode::Research:
        case LayoutMode::UltraWide:
        case LayoutMode::IterativeProjection:
            return false;
        default:
            return true;
        }
    }

private Q_SLOTS:

    void initTestCase()
    {
        // Solvers legitimately report non-convergence on very dense inputs
        QLoggingCategory::setFilterRules(QStringLiteral("plasmaarrange.*=false"));
    }

    void test_resultCountMatchesWindowCount()
    {
        for (const Screen &screen : screens()) {
            for (LayoutMode mode : LayoutModeRegistry::allModes()) {
                for (int count = 0; count <= 50; ++count) {
                    const LayoutResult rects = LayoutEngine::calculate(request(mode, count, screen));
                    QVERIFY2(rects.size() == count, describe(mode, count, screen).constData());
                }
            }
        }
    }

    void test_negativeCountIsEmpty()
    {
        const Screen screen = screens().first();
        for (LayoutMode mode : LayoutModeRegistry::allModes()) {
            QVERIFY(LayoutEngine::calculate(request(mode, -3, screen)).isEmpty());
        }
    }

    void test_correctedRectsContainedAndUsable()
    {
        const QSizeF minimum = LayoutSettings().minimumSize;
        for (const Screen &screen : screens()) {
            for (LayoutMode mode : LayoutModeRegistry::allModes()) {
                for (int count = 1; count <= 50; ++count) {
                    const LayoutResult rects = LayoutEngine::calculateCorrected(request(mode, count, screen));
                    const QByteArray context = describe(mode, count, screen);
                    QVERIFY2(rects.size() == count, context.constData());
                    for (const QRectF &r : rects) {
                        QVERIFY2(GeometryUtils::contains(screen.usableFrame, r), context.constData());
                        QVERIFY2(r.width() >= minimum.width() - 1e-6, context.constData());
                        QVERIFY2(r.height() >= minimum.height() - 1e-6, context.constData());
                    }
                }
            }
        }
    }

    void test_deterministic()
    {
        for (const Screen &screen : screens()) {
            for (LayoutMode mode : LayoutModeRegistry::allModes()) {
                const LayoutRequest r = request(mode, 7, screen);
                QCOMPARE(LayoutEngine::calculate(r), LayoutEngine::calculate(r));
            }
        }
    }

    void test_ultrawideAwareModesFallBackToFocus()
    {
        for (const Screen &screen : screens()) {
            const bool wide = screen.aspectRatio() >= 2.0;
            for (LayoutMode mode : LayoutModeRegistry::allModes()) {
                if (!LayoutModeRegistry::isUltrawideAware(mode)) {
                    QVERIFY(!LayoutEngine::fallsBackToFocus(mode, screen));
                    continue;
                }
                QCOMPARE(LayoutEngine::fallsBackToFocus(mode, screen), !wide);
                if (!wide) {
                    for (int count = 1; count <= 6; ++count) {
                        QCOMPARE(LayoutEngine::calculate(request(mode, count, screen)),
                                 BasicLayouts::focus(count, screen.usableFrame));
                    }
                }
            }
        }
    }

    void test_ultraWideKeepsOwnLayoutOnWideScreen()
    {
        const Screen wide = screens().at(1);
        QVERIFY(!LayoutEngine::fallsBackToFocus(LayoutMode::UltraWide, wide));
        const LayoutResult rects = LayoutEngine::calculate(request(LayoutMode::UltraWide, 3, wide));
        // Window 0 takes the centre column
        QCOMPARE(rects[0], QRectF(1920 + 860, 0, 1720, 1440));
    }

    void test_tilingModesDoNotOverlap()
    {
        for (const Screen &screen : screens()) {
            for (LayoutMode mode : LayoutModeRegistry::allModes()) {
                if (!isTiling(mode) || LayoutEngine::fallsBackToFocus(mode, screen)) {
                    continue;
                }
                for (int count = 1; count <= 12; ++count) {
                    const LayoutResult rects = LayoutEngine::calculate(request(mode, count, screen));
                    const QByteArray context = describe(mode, count, screen);
                    for (int i = 0; i < rects.size(); ++i) {
                        for (int j = i + 1; j < rects.size(); ++j) {
                            QVERIFY2(GeometryUtils::overlapArea(rects[i], rects[j]) < 1e-6, context.constData());
                        }
                    }
                }
            }
        }
    }

    void test_priorFramesOnlySeedProjection()
    {
        const Screen screen = screens().first();
        LayoutRequest seeded = request(LayoutMode::Grid, 2, screen);
        seeded.priorFrames = {QRectF(500, 0, 100, 100), QRectF(0, 50, 100, 100)};
        QCOMPARE(LayoutEngine::calculate(seeded), LayoutEngine::calculate(request(LayoutMode::Grid, 2, screen)));

        seeded.mode = LayoutMode::IterativeProjection;
        QVERIFY(LayoutEngine::calculate(seeded)
                != LayoutEngine::calculate(request(LayoutMode::IterativeProjection, 2, screen)));
    }
};

QTEST_MAIN(TestLayoutProperties)
#include "test_layout_properties.moc"
