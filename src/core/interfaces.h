// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmaarrange_export.h"
#include "types.h"
#include <QRectF>
#include <QVector>
#include <optional>

namespace PlasmaArrange {

/**
 * @brief Capability that enumerates movable windows and reports their frames
 *
 * Implemented by the platform layer (compositor bridge, accessibility API,
 * test fakes). Pure abstract (no QObject) so implementations can combine it
 * with IWindowSink freely.
 *
 * Implementations may cache results for a short time; the engine itself does
 * not cache.
 */
class PLASMAARRANGE_EXPORT IWindowSource
{
public:
    IWindowSource() = default;
    virtual ~IWindowSource();

    /**
     * @brief Movable windows in stacking/arrangement order
     */
    virtual QVector<WindowHandle> listWindows() const = 0;

    /**
     * @brief Current frame of a window
     * @return The frame, or std::nullopt if the window is gone
     */
    virtual std::optional<QRectF> currentFrame(const WindowHandle &handle) const = 0;
};

/**
 * @brief Capability that physically moves and resizes windows
 *
 * A failure for one handle (e.g. the window closed mid-operation) must not
 * prevent callers from writing the remaining handles.
 */
class PLASMAARRANGE_EXPORT IWindowSink
{
public:
    IWindowSink() = default;
    virtual ~IWindowSink();

    /**
     * @brief Move/resize a window
     * @return true if the platform accepted the new frame
     */
    virtual bool setFrame(const WindowHandle &handle, const QRectF &frame) = 0;
};

} // namespace PlasmaArrange
