// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ConstraintSolvers.h"
#include "arrange/LayoutHelpers.h"
#include "core/constants.h"
#include "core/logging.h"
#include <algorithm>
#include <cmath>

namespace PlasmaArrange {

using namespace LayoutConstants;

LayoutResult ConstraintSolvers::activeSet(int windowCount, const QRectF &area)
{
    LayoutResult rects = LayoutHelpers::splitColumns(area, windowCount);
    if (rects.size() < 3) {
        // One or two columns all touch an edge; nothing to redistribute
        return rects;
    }

    const qreal left = area.x();
    const qreal right = area.x() + std::max(area.width(), 0.0);
    auto isActive = [&](const QRectF &r) {
        return std::abs(r.left() - left) <= ActiveSetBoundaryTolerance
            || std::abs(r.right() - right) <= ActiveSetBoundaryTolerance;
    };

    QVector<int> inactive;
    for (int i = 0; i < rects.size(); ++i) {
        if (!isActive(rects[i])) {
            inactive.append(i);
        }
    }
    if (inactive.isEmpty()) {
        return rects;
    }

    const qreal bandWidth = (right - left) * ActiveSetCentralFraction;
    const QRectF band(left + (right - left - bandWidth) / 2.0, area.y(), bandWidth, rects.first().height());
    const QVector<QRectF> bandColumns = LayoutHelpers::splitColumns(band, inactive.size());
    for (int k = 0; k < inactive.size(); ++k) {
        rects[inactive[k]] = bandColumns[k];
    }

    // Active windows keep their anchored edge and give up whatever reaches into the band
    for (int i = 0; i < rects.size(); ++i) {
        if (inactive.contains(i)) {
            continue;
        }
        QRectF &r = rects[i];
        if (std::abs(r.left() - left) <= ActiveSetBoundaryTolerance) {
            r.setRight(std::min(r.right(), band.left()));
        } else {
            r.setLeft(std::max(r.left(), band.right()));
        }
    }

    qCDebug(lcSolver) << "activeSet:" << rects.size() - inactive.size() << "active," << inactive.size()
                      << "sharing the central band";
    return rects;
}

} // namespace PlasmaArrange
