// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QSizeF>

namespace PlasmaArrange {

/**
 * @brief Post-pass that keeps windows on screen and usable
 *
 * Applied to every layout result and, through WindowArranger, to the frames
 * windows actually have. correct() is idempotent: correcting a corrected
 * frame returns it unchanged.
 *
 * Steps, in order:
 * 1. Horizontal overflow. A frame wider than the bounds shrinks to 95% of
 *    the bounds' width (height scaled by the same factor, keeping the aspect
 *    ratio) and is centred horizontally. It never shrinks below the minimum
 *    width; a frame still wider than the bounds then aligns to their left
 *    edge. Otherwise it is moved inside: to the
 *    centre when its own centre lies outside the bounds, else by the smallest
 *    offset.
 * 2. Vertical overflow. A frame taller than the bounds gets the bounds'
 *    height and moves to the top; otherwise it is moved inside like step 1.
 * 3. Minimum size. A frame below minimumSize grows to it (top-left kept) and
 *    is translated back into the bounds. When the bounds are smaller than
 *    the minimum the frame stays at minimum size and overhangs right/bottom.
 */
namespace BoundaryCorrector {

/**
 * @brief Corrected copy of one frame
 */
PLASMAARRANGE_EXPORT QRectF correct(const QRectF &frame, const QRectF &bounds, const QSizeF &minimumSize);

/**
 * @brief Whether correct() would change the frame
 *
 * Lets callers skip writes for windows that are already fine.
 */
PLASMAARRANGE_EXPORT bool needsCorrection(const QRectF &frame, const QRectF &bounds, const QSizeF &minimumSize);

/**
 * @brief correct() applied to every rect, order preserved
 */
PLASMAARRANGE_EXPORT LayoutResult correctAll(const LayoutResult &frames, const QRectF &bounds,
                                             const QSizeF &minimumSize);

} // namespace BoundaryCorrector

} // namespace PlasmaArrange
