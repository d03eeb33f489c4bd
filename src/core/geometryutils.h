// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmaarrange_export.h"
#include <QRect>
#include <QRectF>
#include <QSizeF>

namespace PlasmaArrange {

/**
 * @brief Geometry kernel shared by every layout mode and the corrector
 *
 * All functions are total: degenerate inputs (zero-area or negative-size
 * rects) produce zero-area results instead of failing. Rectangles use
 * floating-point screen coordinates with an exclusive right/bottom edge
 * (right = x + width).
 */
namespace GeometryUtils {

/**
 * @brief Check whether inner lies entirely inside outer
 *
 * Edges are compared with a small epsilon so that layouts assembled from
 * fractional slices still count as contained. Zero-area rects are handled
 * like any other rect (unlike QRectF::contains(), which rejects them).
 */
PLASMAARRANGE_EXPORT bool contains(const QRectF &outer, const QRectF &inner);

/**
 * @brief Overlapping region of two rects
 * @return The intersection, or an empty QRectF() when the rects are disjoint
 */
PLASMAARRANGE_EXPORT QRectF intersection(const QRectF &a, const QRectF &b);

/**
 * @brief Area of a rect (0 for degenerate rects)
 */
PLASMAARRANGE_EXPORT qreal area(const QRectF &rect);

/**
 * @brief Area shared by two rects
 */
PLASMAARRANGE_EXPORT qreal overlapArea(const QRectF &a, const QRectF &b);

/**
 * @brief Width / height, or 0 when the height is not positive
 */
PLASMAARRANGE_EXPORT qreal aspectRatio(const QRectF &rect);

/**
 * @brief Translate and shrink a rect minimally so it fits inside bounds
 *
 * Each dimension is first limited to the bounds' dimension, then the rect is
 * moved by the smallest offset that brings it inside. The result always
 * satisfies contains(bounds, result).
 */
PLASMAARRANGE_EXPORT QRectF clampInto(const QRectF &rect, const QRectF &bounds);

/**
 * @brief Translate a rect into bounds without changing its size
 *
 * A dimension larger than the bounds is aligned to the bounds' left/top edge
 * and left overhanging on the right/bottom.
 */
PLASMAARRANGE_EXPORT QRectF translateInto(const QRectF &rect, const QRectF &bounds);

/**
 * @brief Rect of the given size centred within another rect
 *
 * Negative sizes are treated as zero. The result may extend past within when
 * the size is larger.
 */
PLASMAARRANGE_EXPORT QRectF centered(const QSizeF &size, const QRectF &within);

/**
 * @brief Convert QRectF to QRect with edge-consistent rounding
 *
 * Unlike QRectF::toRect() which rounds x, y, width, height independently,
 * this rounds the edges (left, top, right, bottom) and derives width/height
 * from the rounded edges, so adjacent rects sharing a fractional edge stay
 * adjacent after rounding.
 */
PLASMAARRANGE_EXPORT QRect snapToRect(const QRectF &rf);

} // namespace GeometryUtils

} // namespace PlasmaArrange
