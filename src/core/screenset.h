// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmaarrange_export.h"
#include "types.h"
#include <QPointF>
#include <QRectF>
#include <QVector>

namespace PlasmaArrange {

/**
 * @brief Snapshot of the connected screens
 *
 * Value type supplied by the caller (typically rebuilt whenever the display
 * configuration changes). Lookups return pointers into the snapshot, or
 * nullptr when nothing matches.
 */
class PLASMAARRANGE_EXPORT ScreenSet
{
public:
    ScreenSet() = default;
    explicit ScreenSet(const QVector<Screen> &screens);

    const QVector<Screen> &screens() const noexcept
    {
        return m_screens;
    }
    int count() const noexcept
    {
        return m_screens.size();
    }
    bool isEmpty() const noexcept
    {
        return m_screens.isEmpty();
    }

    /**
     * @brief Screen by position in the snapshot
     * @return The screen, or nullptr if index is out of range
     */
    const Screen *screen(int index) const;

    /**
     * @brief Screen whose full frame contains a point
     */
    const Screen *screenAt(const QPointF &point) const;

    /**
     * @brief Screen a window belongs to
     *
     * The screen whose full frame shares the largest area with the window;
     * the first screen when the window is off every screen.
     */
    const Screen *screenForWindow(const QRectF &frame) const;

private:
    QVector<Screen> m_screens;
};

} // namespace PlasmaArrange
