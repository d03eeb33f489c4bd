// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "arrange/LayoutModeRegistry.h"
#include "arrange/WindowArranger.h"
#include "config/arrangeconfig.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include "core/logging.h"
#include "core/snapposition.h"
#include "dryrunwindows.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>
#include <KAboutData>
#include <KConfig>
#include <KConfigGroup>
#include <KLocalizedString>
#include <optional>

using namespace PlasmaArrange;

namespace {

// WxH or WxH+X+Y
std::optional<QRectF> parseScreenGeometry(const QString &text)
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d+)x(\\d+)(?:([+-]\\d+)([+-]\\d+))?$"));
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const qreal width = match.captured(1).toDouble();
    const qreal height = match.captured(2).toDouble();
    const qreal x = match.captured(3).isEmpty() ? 0.0 : match.captured(3).toDouble();
    const qreal y = match.captured(4).isEmpty() ? 0.0 : match.captured(4).toDouble();
    return QRectF(x, y, width, height);
}

// X,Y
std::optional<QPointF> parsePoint(const QString &text)
{
    static const QRegularExpression pattern(QStringLiteral("^(-?\\d+(?:\\.\\d+)?),(-?\\d+(?:\\.\\d+)?)$"));
    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return QPointF(match.captured(1).toDouble(), match.captured(2).toDouble());
}

void printModes(QTextStream &out)
{
    for (LayoutMode mode : LayoutModeRegistry::allModes()) {
        out << LayoutModeRegistry::modeId(mode) << '\t'
            << LayoutModeRegistry::familyId(LayoutModeRegistry::family(mode)) << '\t'
            << LayoutModeRegistry::displayName(mode) << '\n';
    }
}

void printSnapPositions(QTextStream &out)
{
    for (SnapPosition position : SnapPositions::all()) {
        out << SnapPositions::id(position) << '\t' << SnapPositions::displayName(position) << '\n';
    }
}

int fail(const QString &message)
{
    QTextStream(stderr) << message << '\n';
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("plasmaarrange");

    KAboutData aboutData(QStringLiteral("plasmaarrange"), i18n("PlasmaArrange"), QStringLiteral("1.0.0"),
                         i18n("Computes window arrangements for a screen"), KAboutLicense::GPL_V3,
                         i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption modeOption(QStringList{QStringLiteral("m"), QStringLiteral("mode")},
                                  i18n("Layout mode identifier (see --list-modes)"), i18n("id"));
    QCommandLineOption windowsOption(QStringList{QStringLiteral("n"), QStringLiteral("windows")},
                                     i18n("Number of windows to arrange"), i18n("count"), QStringLiteral("4"));
    QCommandLineOption screenOption(QStringList{QStringLiteral("s"), QStringLiteral("screen")},
                                    i18n("Usable screen area as WxH or WxH+X+Y"), i18n("geometry"),
                                    QStringLiteral("1920x1080"));
    QCommandLineOption paddingOption(QStringList{QStringLiteral("p"), QStringLiteral("padding")},
                                     i18n("Grid padding in pixels (%1-%2)", ArrangeDefaults::MinGridPadding,
                                          ArrangeDefaults::MaxGridPadding),
                                     i18n("px"));
    QCommandLineOption snapOption(QStringLiteral("snap"),
                                  i18n("Place every window at a snap position instead of using a layout mode"),
                                  i18n("position"));
    QCommandLineOption dropOption(QStringLiteral("drop"),
                                  i18n("Snap every window as if dropped at a point near a screen edge"),
                                  i18n("x,y"));
    QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                    i18n("Read settings from the [%1] group of a config file",
                                         QString::fromLatin1(ArrangeConfigKeys::Group)),
                                    i18n("file"));
    QCommandLineOption listModesOption(QStringLiteral("list-modes"), i18n("List the available layout modes"));
    QCommandLineOption listSnapsOption(QStringLiteral("list-snap-positions"), i18n("List the snap positions"));
    parser.addOptions({modeOption, windowsOption, screenOption, paddingOption, snapOption, dropOption, configOption,
                       listModesOption, listSnapsOption});

    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream out(stdout);
    if (parser.isSet(listModesOption)) {
        printModes(out);
        return 0;
    }
    if (parser.isSet(listSnapsOption)) {
        printSnapPositions(out);
        return 0;
    }

    ArrangeConfig config;
    if (parser.isSet(configOption)) {
        const QString path = parser.value(configOption);
        if (!QFileInfo::exists(path)) {
            return fail(i18n("Config file not found: %1", path));
        }
        KConfig file(path, KConfig::SimpleConfig);
        config = ArrangeConfig::fromConfigGroup(file.group(QString::fromLatin1(ArrangeConfigKeys::Group)));
    }

    if (parser.isSet(paddingOption)) {
        bool ok = false;
        const int padding = parser.value(paddingOption).toInt(&ok);
        if (!ok || padding < ArrangeDefaults::MinGridPadding || padding > ArrangeDefaults::MaxGridPadding) {
            return fail(i18n("Invalid padding: %1", parser.value(paddingOption)));
        }
        config.gridPadding = padding;
    }

    bool countOk = false;
    const int windowCount = parser.value(windowsOption).toInt(&countOk);
    if (!countOk || windowCount < 0) {
        return fail(i18n("Invalid window count: %1", parser.value(windowsOption)));
    }

    const std::optional<QRectF> geometry = parseScreenGeometry(parser.value(screenOption));
    if (!geometry) {
        return fail(i18n("Invalid screen geometry: %1", parser.value(screenOption)));
    }
    const Screen screen = Screen::fromGeometry(*geometry, QStringLiteral("cli"));

    // Windows start cascaded from the screen origin at the reset size
    DryRunWindows windows;
    for (int i = 0; i < windowCount; ++i) {
        const qreal offset = LayoutConstants::ResetWindowOffset * i;
        windows.addWindow(QStringLiteral("window-%1").arg(i),
                          QRectF(geometry->x() + offset, geometry->y() + offset, LayoutConstants::ResetWindowWidth,
                                 LayoutConstants::ResetWindowHeight));
    }

    WindowArranger arranger(&windows, &windows);
    const LayoutSettings settings = config.layoutSettings();

    int failures = 0;
    if (parser.isSet(snapOption)) {
        const std::optional<SnapPosition> position = SnapPositions::fromId(parser.value(snapOption));
        if (!position) {
            return fail(i18n("Unknown snap position: %1", parser.value(snapOption)));
        }
        for (const WindowHandle &window : windows.listWindows()) {
            if (!arranger.snapWindow(window, *position, screen, settings)) {
                ++failures;
            }
        }
    } else if (parser.isSet(dropOption)) {
        const std::optional<QPointF> point = parsePoint(parser.value(dropOption));
        if (!point) {
            return fail(i18n("Invalid drop point: %1", parser.value(dropOption)));
        }
        for (const WindowHandle &window : windows.listWindows()) {
            if (!arranger.snapAtPoint(window, *point, screen, settings)) {
                qCDebug(lcCli) << "No snap for" << window << "at" << *point;
            }
        }
    } else {
        LayoutMode mode = config.layoutMode();
        if (parser.isSet(modeOption)) {
            const std::optional<LayoutMode> requested = LayoutModeRegistry::modeFromId(parser.value(modeOption));
            if (!requested) {
                return fail(i18n("Unknown layout mode: %1", parser.value(modeOption)));
            }
            mode = *requested;
        }
        const ArrangeReport report = arranger.arrangeAll(mode, screen, settings);
        qCDebug(lcCli) << "Arranged" << report.applied << "windows with" << LayoutModeRegistry::modeId(mode);
        failures = report.failed;
    }

    const QVector<WindowHandle> handles = windows.listWindows();
    for (int i = 0; i < handles.size(); ++i) {
        const QRect frame = GeometryUtils::snapToRect(windows.currentFrame(handles[i]).value_or(QRectF()));
        out << i << ' ' << frame.x() << ' ' << frame.y() << ' ' << frame.width() << ' ' << frame.height() << '\n';
    }

    if (failures > 0) {
        qCWarning(lcCli) << failures << "window writes failed";
        return 1;
    }
    return 0;
}
