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

LayoutResult ConstraintSolvers::relaxation(int windowCount, const QRectF &area)
{
    if (windowCount <= 0) {
        return {};
    }

    const qreal total = std::max(area.width(), 0.0);
    const qreal inset = total * RelaxationInsetFraction;
    const qreal spacing = total * RelaxationSpacingFraction;
    const qreal width = std::max((total - 2.0 * inset - (windowCount - 1) * spacing) / windowCount, 0.0);
    const qreal left = area.x();
    const qreal right = area.x() + total;

    // Start from equal columns
    QVector<qreal> xs;
    xs.reserve(windowCount);
    for (const QRectF &column : LayoutHelpers::splitColumns(area, windowCount)) {
        xs.append(column.x());
    }

    int pass = 0;
    qreal largestMove = 0.0;
    for (; pass < RelaxationMaxPasses; ++pass) {
        largestMove = 0.0;
        for (int i = 0; i < windowCount; ++i) {
            qreal target;
            if (i == 0) {
                target = left + inset;
            } else if (i == windowCount - 1) {
                target = right - inset - width;
            } else {
                // Gauss-Seidel: the left neighbour has already moved this pass
                target = xs[i - 1] + width + spacing;
            }
            const qreal next = xs[i] * (1.0 - RelaxationFactor) + target * RelaxationFactor;
            largestMove = std::max(largestMove, std::abs(next - xs[i]));
            xs[i] = next;
        }
        if (largestMove < RelaxationTolerance) {
            ++pass;
            break;
        }
    }

    if (largestMove >= RelaxationTolerance) {
        qCWarning(lcSolver) << "relaxation: still moving" << largestMove << "px after" << pass << "passes";
    } else {
        qCDebug(lcSolver) << "relaxation:" << windowCount << "windows converged in" << pass << "passes";
    }

    LayoutResult rects;
    rects.reserve(windowCount);
    for (qreal x : xs) {
        rects.append(QRectF(x, area.y(), width, std::max(area.height(), 0.0)));
    }
    return rects;
}

} // namespace PlasmaArrange
