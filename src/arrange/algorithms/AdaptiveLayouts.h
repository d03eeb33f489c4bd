// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>

namespace PlasmaArrange {

/**
 * @brief Modes whose shape depends on the window count or screen shape
 */
namespace AdaptiveLayouts {

/**
 * @brief Four fixed quadrants; window i takes quadrant i % 4
 *
 * Order is top-left, top-right, bottom-left, bottom-right. From the fifth
 * window on, windows share quadrants and overlap.
 */
PLASMAARRANGE_EXPORT LayoutResult research(int windowCount, const QRectF &area);

/**
 * @brief Count-dependent arrangement
 *
 * - 1: the whole area
 * - 2: left and right halves
 * - 3: left half, right half split into two rows
 * - 4: quadrants
 * - 5-6: 3x2 grid without padding
 * - more: grid() with the configured padding
 */
PLASMAARRANGE_EXPORT LayoutResult multiTask(int windowCount, const QRectF &area, const LayoutSettings &settings);

/**
 * @brief Column layout for 21:9 and wider screens
 *
 * - 1: centred column, half the width (at most 1600 px), full height
 * - 2: centred 60% column and a 25% column on the right edge; the two
 *   overlap slightly
 * - 3+: 25% / 50% / 25% columns. Window 0 takes the centre; windows
 *   1..(n-1)/2 stack on the left and the rest on the right.
 *
 * Applies the wide-screen math unconditionally. LayoutEngine substitutes
 * Focus on screens narrower than the ultrawide threshold.
 */
PLASMAARRANGE_EXPORT LayoutResult ultraWide(int windowCount, const QRectF &area);

} // namespace AdaptiveLayouts

} // namespace PlasmaArrange
