// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ConstraintSolvers.h"
#include "arrange/LayoutHelpers.h"
#include "arrange/algorithms/BasicLayouts.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include "core/logging.h"
#include <algorithm>
#include <cmath>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace {

qreal barrierMargin(int windowCount, const QRectF &area)
{
    const qreal shorterSide = std::max(std::min(area.width(), area.height()), 0.0);
    const qreal density = std::min(1.0, 2.0 / std::sqrt(static_cast<qreal>(windowCount)));
    return std::max(BarrierMarginFloor, shorterSide * BarrierMarginFraction * density);
}

} // namespace

LayoutResult ConstraintSolvers::interiorPoint(int windowCount, const QRectF &area, const LayoutSettings &settings)
{
    if (windowCount <= 0) {
        return {};
    }

    const qreal margin = barrierMargin(windowCount, area);
    const QRectF feasible = LayoutHelpers::insetRect(area, margin);
    if (feasible.width() < BarrierMinUsableWidth || feasible.height() < BarrierMinUsableHeight) {
        qCDebug(lcSolver) << "interiorPoint: margin" << margin << "leaves" << feasible.size()
                          << "- using the plain grid";
        return BasicLayouts::grid(windowCount, area, settings);
    }

    LayoutResult rects = BasicLayouts::grid(windowCount, feasible, settings);
    int clamped = 0;
    for (QRectF &rect : rects) {
        if (!GeometryUtils::contains(feasible, rect)) {
            rect = GeometryUtils::clampInto(rect, feasible);
            ++clamped;
        }
    }

    qCDebug(lcSolver) << "interiorPoint: margin" << margin << "for" << windowCount << "windows," << clamped
                      << "rects clamped";
    return rects;
}

} // namespace PlasmaArrange
