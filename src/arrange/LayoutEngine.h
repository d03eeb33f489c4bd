// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "LayoutMode.h"
#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QVector>

namespace PlasmaArrange {

/**
 * @brief Everything one layout calculation depends on
 *
 * Built per invocation by the caller and never stored by the engine.
 */
struct PLASMAARRANGE_EXPORT LayoutRequest
{
    LayoutMode mode = LayoutMode::Grid;
    int windowCount = 0;
    Screen screen;
    LayoutSettings settings;
    /// Current frames of the windows, index-aligned; only used when the size matches windowCount
    QVector<QRectF> priorFrames;
};

/**
 * @brief Single dispatch from a LayoutMode to its layout function
 *
 * Stateless: every call is a pure function of the request, so calls from
 * several threads need no synchronisation.
 */
namespace LayoutEngine {

/**
 * @brief Compute raw target rects for a request
 *
 * Returns exactly request.windowCount rects, or none when windowCount <= 0.
 * Ultrawide-aware modes on a usable frame narrower than
 * LayoutConstants::UltrawideAspectThreshold produce the Focus layout instead.
 * The result has not been through the boundary corrector.
 */
PLASMAARRANGE_EXPORT LayoutResult calculate(const LayoutRequest &request);

/**
 * @brief calculate() followed by the boundary corrector
 *
 * Every rect of the result lies inside the usable frame and meets the
 * minimum size (unless the usable frame itself is smaller than the minimum).
 */
PLASMAARRANGE_EXPORT LayoutResult calculateCorrected(const LayoutRequest &request);

/**
 * @brief Whether calculate() would substitute Focus for the requested mode
 */
PLASMAARRANGE_EXPORT bool fallsBackToFocus(LayoutMode mode, const Screen &screen);

} // namespace LayoutEngine

} // namespace PlasmaArrange
