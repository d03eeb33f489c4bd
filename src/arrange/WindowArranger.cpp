// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "WindowArranger.h"
#include "BoundaryCorrector.h"
#include "LayoutEngine.h"
#include "LayoutModeRegistry.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include "core/interfaces.h"
#include "core/logging.h"

namespace PlasmaArrange {

using namespace LayoutConstants;

WindowArranger::WindowArranger(IWindowSource *source, IWindowSink *sink, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_sink(sink)
{
    if (!m_source || !m_sink) {
        qCWarning(lcArrange) << "WindowArranger: created without a window source or sink, writes will fail";
    }
}

WindowArranger::~WindowArranger() = default;

bool WindowArranger::writeFrame(const WindowHandle &window, const QRectF &frame, ArrangeReport &report)
{
    if (m_sink && m_sink->setFrame(window, frame)) {
        return true;
    }

    qCWarning(lcArrange) << "WindowArranger: failed to set frame" << frame << "for window" << window;
    ++report.failed;
    report.failedWindows.append(window);
    Q_EMIT windowWriteFailed(window);
    return false;
}

void WindowArranger::finish(const char *operation, const ArrangeReport &report)
{
    if (report.applied == 0 && report.corrected == 0 && report.failed == 0) {
        return;
    }
    qCInfo(lcArrange).nospace() << operation << ": applied " << report.applied << ", corrected " << report.corrected
                                << ", failed " << report.failed << ", skipped " << report.skipped;
    Q_EMIT windowsArranged(report.applied + report.corrected, report.failed);
}

ArrangeReport WindowArranger::arrange(LayoutMode mode, const QVector<WindowHandle> &windows, const Screen &screen,
                                      const LayoutSettings &settings)
{
    ArrangeReport report;
    if (windows.isEmpty()) {
        qCDebug(lcArrange) << "WindowArranger::arrange: no windows for" << LayoutModeRegistry::modeId(mode);
        return report;
    }

    LayoutRequest request;
    request.mode = mode;
    request.windowCount = windows.size();
    request.screen = screen;
    request.settings = settings;

    // Seed from the current frames only when every window reports one
    if (m_source) {
        QVector<QRectF> prior;
        prior.reserve(windows.size());
        for (const WindowHandle &window : windows) {
            const std::optional<QRectF> frame = m_source->currentFrame(window);
            if (!frame) {
                prior.clear();
                break;
            }
            prior.append(*frame);
        }
        request.priorFrames = prior;
    }

    const LayoutResult rects = LayoutEngine::calculateCorrected(request);
    QVector<WindowHandle> applied;
    applied.reserve(windows.size());
    for (int i = 0; i < windows.size() && i < rects.size(); ++i) {
        if (writeFrame(windows[i], rects[i], report)) {
            ++report.applied;
            applied.append(windows[i]);
        }
    }

    // The platform may have adjusted frames (size hints, decorations); pull
    // anything that ended up off screen back in
    const ArrangeReport followUp = pullOnScreen(applied, screen, settings);
    report.corrected = followUp.corrected;
    report.failed += followUp.failed;
    report.failedWindows.append(followUp.failedWindows);

    finish("arrange", report);
    return report;
}

ArrangeReport WindowArranger::arrangeAll(LayoutMode mode, const Screen &screen, const LayoutSettings &settings)
{
    if (!m_source) {
        qCWarning(lcArrange) << "WindowArranger::arrangeAll: no window source";
        return {};
    }
    return arrange(mode, m_source->listWindows(), screen, settings);
}

bool WindowArranger::snapWindow(const WindowHandle &window, SnapPosition position, const Screen &screen,
                                const LayoutSettings &settings)
{
    const QRectF target = BoundaryCorrector::correct(SnapPositions::geometry(position, screen.usableFrame),
                                                     screen.usableFrame, settings.minimumSize);
    qCDebug(lcArrange) << "WindowArranger::snapWindow:" << window << SnapPositions::id(position) << target;

    ArrangeReport report;
    if (writeFrame(window, target, report)) {
        ++report.applied;
    }
    finish("snapWindow", report);
    return report.applied == 1;
}

std::optional<SnapPosition> WindowArranger::snapAtPoint(const WindowHandle &window, const QPointF &point,
                                                        const Screen &screen, const LayoutSettings &settings)
{
    const std::optional<SnapPosition> position = SnapPositions::detect(point, screen.usableFrame,
                                                                       settings.snapThreshold);
    if (!position) {
        qCDebug(lcArrange) << "WindowArranger::snapAtPoint:" << point << "is not near an edge of" << screen.name;
        return std::nullopt;
    }
    if (!snapWindow(window, *position, screen, settings)) {
        return std::nullopt;
    }
    return position;
}

bool WindowArranger::centerWindow(const WindowHandle &window, const Screen &screen, const LayoutSettings &settings)
{
    return snapWindow(window, SnapPosition::Center, screen, settings);
}

bool WindowArranger::maximizeWindow(const WindowHandle &window, const Screen &screen, const LayoutSettings &settings)
{
    return snapWindow(window, SnapPosition::Maximize, screen, settings);
}

bool WindowArranger::moveWindowToScreen(const WindowHandle &window, const Screen &target,
                                        const LayoutSettings &settings)
{
    const std::optional<QRectF> frame = m_source ? m_source->currentFrame(window) : std::nullopt;
    if (!frame) {
        qCWarning(lcArrange) << "WindowArranger::moveWindowToScreen: no frame for window" << window;
        return false;
    }

    const QRectF moved = BoundaryCorrector::correct(GeometryUtils::centered(frame->size(), target.usableFrame),
                                                    target.usableFrame, settings.minimumSize);
    ArrangeReport report;
    if (writeFrame(window, moved, report)) {
        ++report.applied;
    }
    finish("moveWindowToScreen", report);
    return report.applied == 1;
}

ArrangeReport WindowArranger::resetWindows(const QVector<WindowHandle> &windows, const Screen &screen,
                                           const LayoutSettings &settings)
{
    ArrangeReport report;
    const QRectF base = GeometryUtils::centered(QSizeF(ResetWindowWidth, ResetWindowHeight), screen.usableFrame);
    for (int i = 0; i < windows.size(); ++i) {
        const qreal offset = ResetWindowOffset * i;
        const QRectF target = BoundaryCorrector::correct(base.translated(offset, offset), screen.usableFrame,
                                                         settings.minimumSize);
        if (writeFrame(windows[i], target, report)) {
            ++report.applied;
        }
    }
    finish("resetWindows", report);
    return report;
}

ArrangeReport WindowArranger::keepWindowsOnScreen(const QVector<WindowHandle> &windows, const Screen &screen,
                                                  const LayoutSettings &settings)
{
    const ArrangeReport report = pullOnScreen(windows, screen, settings);
    finish("keepWindowsOnScreen", report);
    return report;
}

ArrangeReport WindowArranger::pullOnScreen(const QVector<WindowHandle> &windows, const Screen &screen,
                                           const LayoutSettings &settings)
{
    ArrangeReport report;
    if (!m_source) {
        report.skipped = windows.size();
        return report;
    }

    for (const WindowHandle &window : windows) {
        const std::optional<QRectF> frame = m_source->currentFrame(window);
        if (!frame || !BoundaryCorrector::needsCorrection(*frame, screen.usableFrame, settings.minimumSize)) {
            ++report.skipped;
            continue;
        }
        const QRectF fixed = BoundaryCorrector::correct(*frame, screen.usableFrame, settings.minimumSize);
        qCDebug(lcArrange) << "WindowArranger::pullOnScreen:" << window << *frame << "->" << fixed;
        if (writeFrame(window, fixed, report)) {
            ++report.corrected;
        }
    }
    return report;
}

} // namespace PlasmaArrange
