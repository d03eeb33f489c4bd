// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ConstraintSolvers.h"
#include "arrange/LayoutHelpers.h"
#include "core/constants.h"
#include "core/logging.h"
#include <algorithm>

namespace PlasmaArrange {

using namespace LayoutConstants;

LayoutResult ConstraintSolvers::pivotExpansion(int windowCount, const QRectF &area)
{
    LayoutResult rects = LayoutHelpers::splitColumns(area, windowCount);
    if (rects.size() < 2) {
        return rects;
    }

    const qreal total = std::max(area.width(), 0.0);
    const qreal share = total / windowCount;
    const qreal softCap = share * PivotSoftCapFactor;
    const qreal minimumWidth = share * PivotFloorFactor;
    const qreal increment = total * PivotIncrementFraction;

    int pivots = 0;
    for (; pivots < PivotMaxIterations; ++pivots) {
        // Entering column: most room below the cap, lowest index on ties.
        // The last column has no right neighbour to compress.
        int entering = -1;
        qreal bestRoom = increment;
        for (int i = 0; i + 1 < rects.size(); ++i) {
            const qreal room = softCap - rects[i].width();
            if (room > bestRoom && rects[i + 1].width() - increment >= minimumWidth) {
                bestRoom = room;
                entering = i;
            }
        }
        if (entering < 0) {
            break;
        }

        rects[entering].setWidth(rects[entering].width() + increment);
        QRectF &neighbour = rects[entering + 1];
        neighbour.setLeft(neighbour.left() + increment);
    }

    // Re-normalise so the rightmost column ends exactly on the right edge
    QRectF &last = rects.last();
    last.setWidth(std::max(area.x() + total - last.x(), 0.0));

    qCDebug(lcSolver) << "pivotExpansion:" << pivots << "pivots for" << windowCount << "windows";
    return rects;
}

} // namespace PlasmaArrange
