// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "LayoutMode.h"
#include "core/snapposition.h"
#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QObject>
#include <QPointF>
#include <QVector>
#include <optional>

namespace PlasmaArrange {

class IWindowSink;
class IWindowSource;

/**
 * @brief Outcome of one batch operation
 *
 * A rejected write is counted and listed but never stops the batch; partial
 * application is a normal outcome.
 */
struct PLASMAARRANGE_EXPORT ArrangeReport
{
    int applied = 0;   ///< Layout writes the sink accepted
    int corrected = 0; ///< Follow-up writes that pulled a window back on screen
    int failed = 0;    ///< Writes the sink rejected
    int skipped = 0;   ///< Windows left alone (no frame available, or already valid)
    QVector<WindowHandle> failedWindows;

    bool hasFailures() const noexcept
    {
        return failed > 0;
    }
};

/**
 * @brief Orchestrator between the layout engine and the platform
 *
 * The only component that talks to the Window Source and Sink. Layout math
 * is delegated to LayoutEngine and BoundaryCorrector; this class gathers
 * frames, drives the sink and aggregates the results.
 *
 * Source and sink are not owned and must outlive the arranger. Call from the
 * thread the platform layer requires; the arranger adds no locking.
 */
class PLASMAARRANGE_EXPORT WindowArranger : public QObject
{
    Q_OBJECT

public:
    explicit WindowArranger(IWindowSource *source, IWindowSink *sink, QObject *parent = nullptr);
    ~WindowArranger() override;

    /**
     * @brief Lay out a window batch with a mode
     *
     * Computes the layout (seeded with the windows' current frames when the
     * source knows all of them), runs the boundary pass, writes every window,
     * then re-checks the applied windows' actual frames and writes only those
     * that still need a correction. An empty batch makes no sink calls.
     *
     * @return Report; report.applied is the number of windows moved
     */
    ArrangeReport arrange(LayoutMode mode, const QVector<WindowHandle> &windows, const Screen &screen,
                          const LayoutSettings &settings = {});

    /**
     * @brief arrange() over every window the source lists
     */
    ArrangeReport arrangeAll(LayoutMode mode, const Screen &screen, const LayoutSettings &settings = {});

    /**
     * @brief Move one window to a snap preset
     * @return true if the sink accepted the frame
     */
    bool snapWindow(const WindowHandle &window, SnapPosition position, const Screen &screen,
                    const LayoutSettings &settings = {});

    /**
     * @brief Snap a window dropped at a point to the preset for the nearest edge
     *
     * Uses SnapPositions::detect() with settings.snapThreshold on the
     * screen's usable frame. A drop away from every edge writes nothing.
     *
     * @return The preset the window was moved to, or std::nullopt when no
     *         edge matched or the sink rejected the frame
     */
    std::optional<SnapPosition> snapAtPoint(const WindowHandle &window, const QPointF &point, const Screen &screen,
                                            const LayoutSettings &settings = {});

    bool centerWindow(const WindowHandle &window, const Screen &screen, const LayoutSettings &settings = {});
    bool maximizeWindow(const WindowHandle &window, const Screen &screen, const LayoutSettings &settings = {});

    /**
     * @brief Centre a window on another screen, keeping its size
     * @return false if the window has no frame or the sink rejected it
     */
    bool moveWindowToScreen(const WindowHandle &window, const Screen &target, const LayoutSettings &settings = {});

    /**
     * @brief Put every window back to a default 800x600 frame
     *
     * Window i is centred and then offset 30*i px right and down.
     */
    ArrangeReport resetWindows(const QVector<WindowHandle> &windows, const Screen &screen,
                               const LayoutSettings &settings = {});

    /**
     * @brief Boundary pass over the windows' actual frames
     *
     * Only windows whose current frame needs a correction are written.
     * Corrections are counted in report.corrected.
     */
    ArrangeReport keepWindowsOnScreen(const QVector<WindowHandle> &windows, const Screen &screen,
                                      const LayoutSettings &settings = {});

Q_SIGNALS:
    /**
     * @brief Emitted after every batch operation that touched at least one window
     */
    void windowsArranged(int applied, int failed);

    /**
     * @brief Emitted for each write the sink rejected
     */
    void windowWriteFailed(const QString &window);

private:
    bool writeFrame(const WindowHandle &window, const QRectF &frame, ArrangeReport &report);
    void finish(const char *operation, const ArrangeReport &report);
    ArrangeReport pullOnScreen(const QVector<WindowHandle> &windows, const Screen &screen,
                               const LayoutSettings &settings);

    IWindowSource *m_source = nullptr;
    IWindowSink *m_sink = nullptr;
};

} // namespace PlasmaArrange
