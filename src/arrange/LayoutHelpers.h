// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QVector>

namespace PlasmaArrange {

/**
 * @brief Partitioning primitives shared by the layout modes
 *
 * Slices are computed from cumulative boundaries rather than by adding up
 * widths, so adjacent slices share exact edges and the last slice always ends
 * on the area's right/bottom edge.
 */
namespace LayoutHelpers {

/**
 * @brief Split an area into equal-width columns, left to right
 * @return count rects, empty for count <= 0
 */
PLASMAARRANGE_EXPORT QVector<QRectF> splitColumns(const QRectF &area, int count);

/**
 * @brief Split an area into equal-height rows, top to bottom
 */
PLASMAARRANGE_EXPORT QVector<QRectF> splitRows(const QRectF &area, int count);

/**
 * @brief Split an area into columns proportional to fractions
 *
 * Fractions are normalised to their sum; non-positive entries get no width.
 * Example: splitColumnsByFractions({0,0,1000,500}, {0.6, 0.4}) returns
 * {0,0,600,500} and {600,0,400,500}.
 */
PLASMAARRANGE_EXPORT QVector<QRectF> splitColumnsByFractions(const QRectF &area, const QVector<qreal> &fractions);

/**
 * @brief Split an area into rows proportional to fractions
 */
PLASMAARRANGE_EXPORT QVector<QRectF> splitRowsByFractions(const QRectF &area, const QVector<qreal> &fractions);

/**
 * @brief Equal cells of a columns x rows grid in row-major order
 *
 * Only the first count cells are returned; cell i sits at column
 * i % columns, row i / columns.
 */
PLASMAARRANGE_EXPORT QVector<QRectF> gridCells(const QRectF &area, int count, int columns, int rows);

/**
 * @brief Shrink an area by a margin on every side plus extra at the bottom
 *
 * Margins larger than the area collapse it to a zero-size rect at its centre
 * instead of producing a negative size.
 */
PLASMAARRANGE_EXPORT QRectF insetRect(const QRectF &area, qreal margin, qreal extraBottom = 0.0);

/**
 * @brief Master-stack partition
 *
 * Window 0 gets mainRatio of the width at the left edge and the full height.
 * With a single window that is the only rect. Remaining windows share the
 * complementary column in equal rows.
 */
PLASMAARRANGE_EXPORT QVector<QRectF> masterStack(const QRectF &area, int count, qreal mainRatio);

} // namespace LayoutHelpers

} // namespace PlasmaArrange
