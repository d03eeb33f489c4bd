// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "BasicLayouts.h"
#include "arrange/LayoutHelpers.h"
#include "core/constants.h"
#include <algorithm>
#include <cmath>

namespace PlasmaArrange {

using namespace LayoutConstants;

LayoutResult BasicLayouts::grid(int windowCount, const QRectF &area, const LayoutSettings &settings)
{
    if (windowCount <= 0) {
        return {};
    }

    const int columns = static_cast<int>(std::ceil(std::sqrt(static_cast<qreal>(windowCount))));
    const int rows = (windowCount + columns - 1) / columns;
    const QRectF inner = LayoutHelpers::insetRect(area, settings.padding, settings.dockClearance);
    return LayoutHelpers::gridCells(inner, windowCount, columns, rows);
}

LayoutResult BasicLayouts::horizontal(int windowCount, const QRectF &area)
{
    return LayoutHelpers::splitColumns(area, windowCount);
}

LayoutResult BasicLayouts::vertical(int windowCount, const QRectF &area)
{
    return LayoutHelpers::splitRows(area, windowCount);
}

LayoutResult BasicLayouts::cascade(int windowCount, const QRectF &area)
{
    LayoutResult rects;
    if (windowCount <= 0) {
        return rects;
    }

    const qreal width = std::min(std::max(area.width(), 0.0) * CascadeSizeFraction, CascadeMaxWidth);
    const qreal height = std::min(std::max(area.height(), 0.0) * CascadeSizeFraction, CascadeMaxHeight);

    rects.reserve(windowCount);
    for (int i = 0; i < windowCount; ++i) {
        const qreal offset = CascadeOffset * i;
        rects.append(QRectF(area.x() + offset, area.y() + offset, width, height));
    }
    return rects;
}

LayoutResult BasicLayouts::fibonacci(int windowCount, const QRectF &area)
{
    return LayoutHelpers::masterStack(area, windowCount, InverseGoldenRatio);
}

LayoutResult BasicLayouts::focus(int windowCount, const QRectF &area)
{
    return LayoutHelpers::masterStack(area, windowCount, FocusMainRatio);
}

} // namespace PlasmaArrange
