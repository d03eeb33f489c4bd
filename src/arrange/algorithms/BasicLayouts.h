// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>

namespace PlasmaArrange {

/**
 * @brief Simple partitioning modes
 *
 * Every function is pure and returns exactly windowCount rects (none for
 * windowCount <= 0), index-aligned with the input windows. The area is the
 * screen's usable frame.
 */
namespace BasicLayouts {

/**
 * @brief Even grid, row-major
 *
 * columns = ceil(sqrt(n)), rows = ceil(n / columns). The area is first inset
 * by settings.padding on every side and settings.dockClearance more at the
 * bottom. A last row with fewer windows leaves empty cells on the right.
 *
 * ```
 * +------+------+------+
 * |  0   |  1   |  2   |
 * +------+------+------+
 * |  3   |  4   |
 * +------+------+
 * ```
 */
PLASMAARRANGE_EXPORT LayoutResult grid(int windowCount, const QRectF &area, const LayoutSettings &settings);

/**
 * @brief Equal-width columns in input order
 */
PLASMAARRANGE_EXPORT LayoutResult horizontal(int windowCount, const QRectF &area);

/**
 * @brief Equal-height rows in input order
 */
PLASMAARRANGE_EXPORT LayoutResult vertical(int windowCount, const QRectF &area);

/**
 * @brief Diagonal cascade
 *
 * Every window gets 70% of the area on each axis (capped at 1000x700) and is
 * offset 30 px right and down from the previous one. Windows overlap by
 * design; deep cascades leave the area and are pulled back by the boundary
 * corrector.
 */
PLASMAARRANGE_EXPORT LayoutResult cascade(int windowCount, const QRectF &area);

/**
 * @brief Golden-ratio master-stack
 *
 * ```
 * +-------------+-------+
 * |             |   1   |
 * |      0      +-------+
 * |   (61.8%)   |   2   |
 * +-------------+-------+
 * ```
 */
PLASMAARRANGE_EXPORT LayoutResult fibonacci(int windowCount, const QRectF &area);

/**
 * @brief Two-thirds master-stack
 */
PLASMAARRANGE_EXPORT LayoutResult focus(int windowCount, const QRectF &area);

} // namespace BasicLayouts

} // namespace PlasmaArrange
