// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QVector>

namespace PlasmaArrange {

/**
 * @brief Iterative layout solvers
 *
 * Each solver starts from a naive partition and refines it. All of them are
 * bounded by a fixed iteration cap and return their best effort when the cap
 * is hit; the boundary corrector makes the final result valid regardless.
 * Working state lives in locals, so every function is pure.
 */
namespace ConstraintSolvers {

/**
 * @brief Golden-ratio widths refined by pairwise overlap projection
 *
 * Window i is weighted φ⁻ⁱ. Every window gets a floor of half an equal share
 * and the remaining width is distributed by weight, so the initial columns
 * fill the area exactly. When priorFrames holds one frame per window, the
 * same widths are handed out in the left-to-right order of those frames, so
 * the leftmost window gets the widest column.
 *
 * Then, for at most ProjectionMaxPasses passes, every pair of horizontally
 * adjacent rects overlapping by more than overlapTolerance is pushed apart by
 * half the overlap each. A rect that would be pushed out of the area is
 * shrunk instead.
 */
PLASMAARRANGE_EXPORT LayoutResult iterativeProjection(int windowCount, const QRectF &area, qreal overlapTolerance,
                                                      const QVector<QRectF> &priorFrames = {});

/**
 * @brief Grid kept inside a barrier margin
 *
 * The margin is 5% of the shorter side, reduced for dense layouts
 * (factor min(1, 2 / sqrt(n))) and never below 8 px. If the area minus the
 * margin is smaller than 320x240 the plain grid on the full area is
 * returned; otherwise the grid is computed on the shrunk area and every rect
 * is clamped back inside the margin.
 */
PLASMAARRANGE_EXPORT LayoutResult interiorPoint(int windowCount, const QRectF &area, const LayoutSettings &settings);

/**
 * @brief Equal columns with boundary-active windows held in place
 *
 * Windows whose left or right edge lies on the area edge keep their anchored
 * edge and are trimmed to stay clear of the central band, so a right-anchored
 * window's left edge moves right to the band. All other windows share the
 * central 60% of the width equally.
 */
PLASMAARRANGE_EXPORT LayoutResult activeSet(int windowCount, const QRectF &area);

/**
 * @brief Under-relaxed successive correction of column positions
 *
 * Columns have a fixed width leaving a 1% inset at both ends and 0.5% spacing
 * between neighbours. The first and last columns target the insets, interior
 * columns target the right edge of their left neighbour plus the spacing.
 * Each pass moves every column 70% of the way to its target and the loop
 * stops once no column moves more than half a pixel.
 */
PLASMAARRANGE_EXPORT LayoutResult relaxation(int windowCount, const QRectF &area);

/**
 * @brief Greedy pivoting growth of equal columns
 *
 * Each pivot grows the column with the most room below its soft cap
 * (1.5x the equal share) by 2% of the width and compresses its right
 * neighbour by the same amount, never below half an equal share. After the
 * last pivot the rightmost column is stretched to meet the right edge.
 */
PLASMAARRANGE_EXPORT LayoutResult pivotExpansion(int windowCount, const QRectF &area);

} // namespace ConstraintSolvers

} // namespace PlasmaArrange
