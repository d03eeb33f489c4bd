// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QRegularExpression>
#include <QSet>

#include "arrange/LayoutModeRegistry.h"
#include "arrange/algorithms/WorkspaceProfiles.h"
#include "core/geometryutils.h"

using namespace PlasmaArrange;

Q_DECLARE_METATYPE(PlasmaArrange::LayoutMode)

/**
 * @brief Tests for the workspace profile table and its executor
 *
 * Tests cover:
 * - Table completeness (one profile per profile-family mode)
 * - Single-window rules (fill, centred column, centred video)
 * - Fill order when fewer windows than slots
 * - Shared overflow slot when more windows than slots
 * - Containment and non-overlap for every profile
 */
class TestWorkspaceProfiles : public QObject
{
    Q_OBJECT

private:
    static QRectF screen()
    {
        return QRectF(0, 0, 1920, 1080);
    }

    static LayoutResult run(LayoutMode mode, int count)
    {
        return WorkspaceProfiles::calculate(mode, count, screen());
    }

private Q_SLOTS:

    // ═══════════════════════════════════════════════════════════════════════════
    // Table
    // ═══════════════════════════════════════════════════════════════════════════

    void test_everyProfileModeHasProfile()
    {
        const QVector<LayoutMode> profileModes = WorkspaceProfiles::profileModes();
        QCOMPARE(profileModes, LayoutModeRegistry::modesInFamily(LayoutFamily::WorkspaceProfile));

        for (LayoutMode mode : profileModes) {
            const WorkspaceProfile *p = WorkspaceProfiles::profile(mode);
            QVERIFY(p != nullptr);
            QCOMPARE(p->mode, mode);
            QVERIFY(p->slots.size() >= 2);

            qreal sum = 0.0;
            for (const ProfileSlot &s : p->slots) {
                QVERIFY(s.fraction > 0.0);
                QVERIFY(!s.role.isEmpty());
                sum += s.fraction;
            }
            QVERIFY2(qFuzzyCompare(sum, 1.0), qPrintable(LayoutModeRegistry::modeId(mode)));
        }
    }

    void test_nonProfileModeHasNoProfile()
    {
        QVERIFY(WorkspaceProfiles::profile(LayoutMode::Grid) == nullptr);
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("no profile for mode")));
        QVERIFY(WorkspaceProfiles::calculate(LayoutMode::Grid, 3, screen()).isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Single window
    // ═══════════════════════════════════════════════════════════════════════════

    void test_singleWindow_data()
    {
        QTest::addColumn<LayoutMode>("mode");
        QTest::addColumn<QRectF>("expected");

        QTest::newRow("coding fills") << LayoutMode::Coding << QRectF(0, 0, 1920, 1080);
        QTest::newRow("reading capped column") << LayoutMode::Reading << QRectF(560, 0, 800, 1080);
        QTest::newRow("learning column") << LayoutMode::Learning << QRectF(288, 0, 1344, 1080);
        QTest::newRow("communication video") << LayoutMode::Communication << QRectF(192, 108, 1536, 864);
        QTest::newRow("video conference") << LayoutMode::VideoConference << QRectF(192, 108, 1536, 864);
    }

    void test_singleWindow()
    {
        QFETCH(LayoutMode, mode);
        QFETCH(QRectF, expected);

        const LayoutResult rects = run(mode, 1);
        QCOMPARE(rects.size(), 1);
        QCOMPARE(rects[0], expected);
    }

    void test_singleWindowRulePerProfile_data()
    {
        QTest::addColumn<LayoutMode>("mode");
        QTest::addColumn<int>("rule");

        const QSet<QString> centered{QStringLiteral("reading"), QStringLiteral("learning")};
        const QSet<QString> video{QStringLiteral("communication"), QStringLiteral("video-conference")};
        for (LayoutMode mode : WorkspaceProfiles::profileModes()) {
            const QString id = LayoutModeRegistry::modeId(mode);
            SingleWindowRule rule = SingleWindowRule::Fill;
            if (centered.contains(id)) {
                rule = SingleWindowRule::Centered;
            } else if (video.contains(id)) {
                rule = SingleWindowRule::CenteredVideo;
            }
            QTest::newRow(qPrintable(id)) << mode << static_cast<int>(rule);
        }
    }

    void test_singleWindowRulePerProfile()
    {
        QFETCH(LayoutMode, mode);
        QFETCH(int, rule);

        const WorkspaceProfile *p = WorkspaceProfiles::profile(mode);
        QVERIFY(p != nullptr);
        QCOMPARE(static_cast<int>(p->singleWindow.rule), rule);

        const LayoutResult rects = run(mode, 1);
        QCOMPARE(rects.size(), 1);
        if (p->singleWindow.rule == SingleWindowRule::Fill) {
            QCOMPARE(rects[0], screen());
        } else {
            QVERIFY(rects[0] != screen());
            QVERIFY(GeometryUtils::contains(screen(), rects[0]));
        }
    }

    void test_noWindows()
    {
        QVERIFY(run(LayoutMode::Coding, 0).isEmpty());
        QVERIFY(run(LayoutMode::Reading, -2).isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Fill order
    // ═══════════════════════════════════════════════════════════════════════════

    void test_coding_twoWindows()
    {
        const LayoutResult rects = run(LayoutMode::Coding, 2);
        QCOMPARE(rects.size(), 2);
        QCOMPARE(rects[0], QRectF(0, 0, 1152, 1080));
        QCOMPARE(rects[1], QRectF(1152, 0, 768, 1080));
    }

    void test_communication_rows()
    {
        const LayoutResult rects = run(LayoutMode::Communication, 2);
        QCOMPARE(rects[0], QRectF(0, 0, 1920, 756));
        QCOMPARE(rects[1], QRectF(0, 756, 1920, 324));
    }

    void test_reading_firstWindowGetsDocument()
    {
        // Two windows: document and reference, renormalised to 2/3 and 1/3
        LayoutResult rects = run(LayoutMode::Reading, 2);
        QCOMPARE(rects.size(), 2);
        QCOMPARE(rects[0], QRectF(640, 0, 1280, 1080));
        QCOMPARE(rects[1], QRectF(0, 0, 640, 1080));

        // Three windows: every slot at its own fraction
        rects = run(LayoutMode::Reading, 3);
        QCOMPARE(rects[0], QRectF(480, 0, 960, 1080));
        QCOMPARE(rects[1], QRectF(0, 0, 480, 1080));
        QCOMPARE(rects[2], QRectF(1440, 0, 480, 1080));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Overflow
    // ═══════════════════════════════════════════════════════════════════════════

    void test_coding_overflowSharesTerminalColumn()
    {
        const LayoutResult rects = run(LayoutMode::Coding, 4);
        QCOMPARE(rects.size(), 4);
        QCOMPARE(rects[0], QRectF(0, 0, 1152, 1080));
        QCOMPARE(rects[1], QRectF(1152, 0, 768, 360));
        QCOMPARE(rects[2], QRectF(1152, 360, 768, 360));
        QCOMPARE(rects[3], QRectF(1152, 720, 768, 360));
    }

    void test_reading_overflowSharesNotesColumn()
    {
        const LayoutResult rects = run(LayoutMode::Reading, 5);
        QCOMPARE(rects.size(), 5);
        QCOMPARE(rects[0], QRectF(480, 0, 960, 1080));
        QCOMPARE(rects[1], QRectF(0, 0, 480, 1080));
        QCOMPARE(rects[2], QRectF(1440, 0, 480, 360));
        QCOMPARE(rects[4], QRectF(1440, 720, 480, 360));
    }

    void test_rowsProfile_overflowSplitsColumns()
    {
        const LayoutResult rects = run(LayoutMode::GameDev, 3);
        QCOMPARE(rects.size(), 3);
        QCOMPARE(rects[0], QRectF(0, 0, 1920, 756));
        QCOMPARE(rects[1], QRectF(0, 756, 960, 324));
        QCOMPARE(rects[2], QRectF(960, 756, 960, 324));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Properties
    // ═══════════════════════════════════════════════════════════════════════════

    void test_allProfiles_containedAndDisjoint()
    {
        for (LayoutMode mode : WorkspaceProfiles::profileModes()) {
            for (int count = 0; count <= 10; ++count) {
                const LayoutResult rects = run(mode, count);
                const QByteArray context =
                    LayoutModeRegistry::modeId(mode).toUtf8() + " n=" + QByteArray::number(count);
                QVERIFY2(rects.size() == count, context.constData());
                for (int i = 0; i < rects.size(); ++i) {
                    QVERIFY2(GeometryUtils::contains(screen(), rects[i]), context.constData());
                    for (int j = i + 1; j < rects.size(); ++j) {
                        QVERIFY2(GeometryUtils::overlapArea(rects[i], rects[j]) < 1e-6, context.constData());
                    }
                }
            }
        }
    }

    void test_slotForWindow()
    {
        const WorkspaceProfile *reading = WorkspaceProfiles::profile(LayoutMode::Reading);
        QVERIFY(reading);
        QCOMPARE(reading->slotForWindow(0), 1);
        QCOMPARE(reading->slotForWindow(1), 0);
        QCOMPARE(reading->slotForWindow(2), 2);

        const WorkspaceProfile *coding = WorkspaceProfiles::profile(LayoutMode::Coding);
        QVERIFY(coding);
        QCOMPARE(coding->slotForWindow(1), 1);
    }
};

QTEST_MAIN(TestWorkspaceProfiles)
#include "test_workspace_profiles.moc"
