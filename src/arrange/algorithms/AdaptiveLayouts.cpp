// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "AdaptiveLayouts.h"
#include "BasicLayouts.h"
#include "arrange/LayoutHelpers.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include <algorithm>

namespace PlasmaArrange {

using namespace LayoutConstants;

LayoutResult AdaptiveLayouts::research(int windowCount, const QRectF &area)
{
    LayoutResult rects;
    if (windowCount <= 0) {
        return rects;
    }

    const QVector<QRectF> quadrants = LayoutHelpers::gridCells(area, QuadrantCount, 2, 2);
    rects.reserve(windowCount);
    for (int i = 0; i < windowCount; ++i) {
        rects.append(quadrants[i % QuadrantCount]);
    }
    return rects;
}

LayoutResult AdaptiveLayouts::multiTask(int windowCount, const QRectF &area, const LayoutSettings &settings)
{
    switch (windowCount) {
    case 0:
        return {};
    case 1:
        return {area};
    case 2:
        return LayoutHelpers::splitColumns(area, 2);
    case 3: {
        const QVector<QRectF> halves = LayoutHelpers::splitColumns(area, 2);
        LayoutResult rects{halves[0]};
        rects.append(LayoutHelpers::splitRows(halves[1], 2));
        return rects;
    }
    case 4:
        return LayoutHelpers::gridCells(area, 4, 2, 2);
    case 5:
    case 6:
        return LayoutHelpers::gridCells(area, windowCount, MultiTaskGridColumns, MultiTaskGridRows);
    default:
        break;
    }

    if (windowCount < 0) {
        return {};
    }
    return BasicLayouts::grid(windowCount, area, settings);
}

LayoutResult AdaptiveLayouts::ultraWide(int windowCount, const QRectF &area)
{
    LayoutResult rects;
    if (windowCount <= 0) {
        return rects;
    }

    const qreal width = std::max(area.width(), 0.0);
    const qreal height = std::max(area.height(), 0.0);

    if (windowCount == 1) {
        const qreal columnWidth = std::min(width * UltrawideSingleFraction, UltrawideSingleMaxWidth);
        rects.append(GeometryUtils::centered(QSizeF(columnWidth, height), area));
        return rects;
    }

    if (windowCount == 2) {
        const qreal sideWidth = width * UltrawidePairSideFraction;
        rects.append(GeometryUtils::centered(QSizeF(width * UltrawidePairCenterFraction, height), area));
        rects.append(QRectF(area.x() + width - sideWidth, area.y(), sideWidth, height));
        return rects;
    }

    const qreal side = UltrawideSideColumnFraction;
    const QVector<QRectF> columns = LayoutHelpers::splitColumnsByFractions(area, {side, 1.0 - 2.0 * side, side});
    const int leftCount = (windowCount - 1) / 2;
    const int rightCount = windowCount - 1 - leftCount;

    rects.reserve(windowCount);
    rects.append(columns[1]);
    rects.append(LayoutHelpers::splitRows(columns[0], leftCount));
    rects.append(LayoutHelpers::splitRows(columns[2], rightCount));
    return rects;
}

} // namespace PlasmaArrange
