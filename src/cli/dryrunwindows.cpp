// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dryrunwindows.h"
#include "core/logging.h"

namespace PlasmaArrange {

DryRunWindows::~DryRunWindows() = default;

void DryRunWindows::addWindow(const WindowHandle &handle, const QRectF &frame)
{
    if (!m_frames.contains(handle)) {
        m_order.append(handle);
    }
    m_frames.insert(handle, frame);
}

QVector<WindowHandle> DryRunWindows::listWindows() const
{
    return m_order;
}

std::optional<QRectF> DryRunWindows::currentFrame(const WindowHandle &handle) const
{
    const auto it = m_frames.constFind(handle);
    if (it == m_frames.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool DryRunWindows::setFrame(const WindowHandle &handle, const QRectF &frame)
{
    auto it = m_frames.find(handle);
    if (it == m_frames.end()) {
        qCWarning(lcCli) << "DryRunWindows: unknown window" << handle;
        return false;
    }
    it.value() = frame;
    return true;
}

} // namespace PlasmaArrange
