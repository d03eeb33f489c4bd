// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/interfaces.h"
#include <QHash>
#include <QRectF>
#include <QVector>

namespace PlasmaArrange {

/**
 * @brief In-memory window list for the command-line front end
 *
 * Acts as both Window Source and Window Sink: setFrame() stores the frame
 * and currentFrame() reports it back, so an arrangement can be computed and
 * inspected without touching real windows.
 */
class DryRunWindows : public IWindowSource, public IWindowSink
{
public:
    DryRunWindows() = default;
    ~DryRunWindows() override;

    /**
     * @brief Add a window with an initial frame, keeping insertion order
     */
    void addWindow(const WindowHandle &handle, const QRectF &frame);

    QVector<WindowHandle> listWindows() const override;
    std::optional<QRectF> currentFrame(const WindowHandle &handle) const override;
    bool setFrame(const WindowHandle &handle, const QRectF &frame) override;

private:
    QVector<WindowHandle> m_order;
    QHash<WindowHandle, QRectF> m_frames;
};

} // namespace PlasmaArrange
