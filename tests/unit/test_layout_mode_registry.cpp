// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QSet>

#include "arrange/LayoutModeRegistry.h"
#include "core/geometryutils.h"

using namespace PlasmaArrange;

/**
 * @brief Tests for LayoutModeRegistry metadata and previews
 */
class TestLayoutModeRegistry : public QObject
{
    Q_OBJECT

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Discovery
    // ═══════════════════════════════════════════════════════════════════════════

    void test_allModesRegistered()
    {
        const QVector<LayoutMode> modes = LayoutModeRegistry::allModes();
        QCOMPARE(modes.size(), 35);
        // Declaration order
        for (int i = 0; i < modes.size(); ++i) {
            QCOMPARE(static_cast<int>(modes[i]), i);
        }
        QCOMPARE(LayoutModeRegistry::availableModeIds().size(), modes.size());
    }

    void test_familyCounts()
    {
        QCOMPARE(LayoutModeRegistry::modesInFamily(LayoutFamily::Basic).size(), 6);
        QCOMPARE(LayoutModeRegistry::modesInFamily(LayoutFamily::WorkspaceProfile).size(), 21);
        QCOMPARE(LayoutModeRegistry::modesInFamily(LayoutFamily::ConstraintSolver).size(), 5);
        QCOMPARE(LayoutModeRegistry::modesInFamily(LayoutFamily::Adaptive).size(), 3);
    }

    void test_familyIds()
    {
        QCOMPARE(LayoutModeRegistry::familyId(LayoutFamily::Basic), QStringLiteral("basic"));
        QCOMPARE(LayoutModeRegistry::familyId(LayoutFamily::WorkspaceProfile), QStringLiteral("profile"));
        QCOMPARE(LayoutModeRegistry::familyId(LayoutFamily::ConstraintSolver), QStringLiteral("solver"));
        QCOMPARE(LayoutModeRegistry::familyId(LayoutFamily::Adaptive), QStringLiteral("adaptive"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Identifiers and metadata
    // ═══════════════════════════════════════════════════════════════════════════

    void test_idsUniqueAndResolvable()
    {
        QSet<QString> seen;
        for (LayoutMode mode : LayoutModeRegistry::allModes()) {
            const QString id = LayoutModeRegistry::modeId(mode);
            QVERIFY(!id.isEmpty());
            QVERIFY2(!seen.contains(id), qPrintable(id));
            seen.insert(id);

            const std::optional<LayoutMode> resolved = LayoutModeRegistry::modeFromId(id);
            QVERIFY(resolved.has_value());
            QCOMPARE(*resolved, mode);
        }
    }

    void test_knownIds()
    {
        QCOMPARE(LayoutModeRegistry::modeFromId(QStringLiteral("grid")), std::optional<LayoutMode>(LayoutMode::Grid));
        QCOMPARE(LayoutModeRegistry::modeFromId(QStringLiteral("focus")),
                 std::optional<LayoutMode>(LayoutMode::Focus));
        QCOMPARE(LayoutModeRegistry::modeFromId(QStringLiteral("iterative-projection")),
                 std::optional<LayoutMode>(LayoutMode::IterativeProjection));
        QCOMPARE(LayoutModeRegistry::modeFromId(QStringLiteral("ultrawide")),
                 std::optional<LayoutMode>(LayoutMode::UltraWide));
    }

    void test_unknownIdIsRejected()
    {
        QVERIFY(!LayoutModeRegistry::modeFromId(QStringLiteral("spiral")).has_value());
        QVERIFY(!LayoutModeRegistry::modeFromId(QStringLiteral("Grid")).has_value());
        QVERIFY(!LayoutModeRegistry::modeFromId(QString()).has_value());
    }

    void test_metadataPresent()
    {
        for (LayoutMode mode : LayoutModeRegistry::allModes()) {
            const QString id = LayoutModeRegistry::modeId(mode);
            QVERIFY2(!LayoutModeRegistry::displayName(mode).isEmpty(), qPrintable(id));
            QVERIFY2(!LayoutModeRegistry::description(mode).isEmpty(), qPrintable(id));
            QVERIFY2(!LayoutModeRegistry::icon(mode).isEmpty(), qPrintable(id));
        }
    }

    void test_ultrawideAwareModes()
    {
        QSet<QString> aware;
        for (LayoutMode mode : LayoutModeRegistry::allModes()) {
            if (LayoutModeRegistry::isUltrawideAware(mode)) {
                aware.insert(LayoutModeRegistry::modeId(mode));
            }
        }
        const QSet<QString> expected{QStringLiteral("ultrawide"), QStringLiteral("trading"), QStringLiteral("monitoring")};
        QCOMPARE(aware, expected);
    }

    void test_defaultMode()
    {
        QCOMPARE(LayoutModeRegistry::defaultMode(), LayoutMode::Grid);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Preview
    // ═══════════════════════════════════════════════════════════════════════════

    void test_previewIsNormalised()
    {
        const QRectF unit(0, 0, 1, 1);
        for (LayoutMode mode : LayoutModeRegistry::allModes()) {
            const QVector<QRectF> preview = LayoutModeRegistry::previewGeometry(mode);
            QCOMPARE(preview.size(), 3);
            for (const QRectF &rect : preview) {
                QVERIFY2(GeometryUtils::contains(unit, rect), qPrintable(LayoutModeRegistry::modeId(mode)));
            }
        }
    }

    void test_previewGrid()
    {
        const QVector<QRectF> preview = LayoutModeRegistry::previewGeometry(LayoutMode::Grid, 4);
        QCOMPARE(preview.size(), 4);
        QCOMPARE(preview[0], QRectF(0, 0, 0.5, 0.5));
        QCOMPARE(preview[3], QRectF(0.5, 0.5, 0.5, 0.5));
    }

    void test_previewEmpty()
    {
        QVERIFY(LayoutModeRegistry::previewGeometry(LayoutMode::Focus, 0).isEmpty());
    }
};

QTEST_MAIN(TestLayoutModeRegistry)
#include "test_layout_mode_registry.moc"
