// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "BoundaryCorrector.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include "core/logging.h"
#include <algorithm>
#include <cmath>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace {

qreal overflow(qreal start, qreal length, qreal boundStart, qreal boundLength)
{
    return std::max(0.0, boundStart - start) + std::max(0.0, (start + length) - (boundStart + boundLength));
}

// Position of a span that fits inside the bounds on one axis
qreal placeOnAxis(qreal start, qreal length, qreal boundStart, qreal boundLength)
{
    const qreal center = start + length / 2.0;
    if (center < boundStart || center > boundStart + boundLength) {
        return boundStart + (boundLength - length) / 2.0;
    }
    return std::clamp(start, boundStart, boundStart + boundLength - length);
}

bool fuzzyEqual(const QRectF &a, const QRectF &b)
{
    return std::abs(a.x() - b.x()) <= GeometryEpsilon && std::abs(a.y() - b.y()) <= GeometryEpsilon
        && std::abs(a.width() - b.width()) <= GeometryEpsilon && std::abs(a.height() - b.height()) <= GeometryEpsilon;
}

} // namespace

QRectF BoundaryCorrector::correct(const QRectF &frame, const QRectF &bounds, const QSizeF &minimumSize)
{
    const QRectF b = bounds.normalized();
    QRectF r = frame.normalized();

    // 1. Horizontal
    if (overflow(r.x(), r.width(), b.x(), b.width()) > GeometryEpsilon) {
        if (r.width() > b.width()) {
            // Bounds narrower than the minimum: shrinking below it would be undone in step 3
            const qreal width = std::max(b.width() * OverflowShrinkFraction, minimumSize.width());
            if (r.width() > width) {
                const qreal scale = width / r.width();
                r = QRectF(b.center().x() - width / 2.0, r.y(), width, r.height() * scale);
            }
            if (r.width() > b.width()) {
                r.moveLeft(b.x());
            }
        } else {
            r.moveLeft(placeOnAxis(r.x(), r.width(), b.x(), b.width()));
        }
    }

    // 2. Vertical
    if (r.height() > b.height()) {
        r = QRectF(r.x(), b.y(), r.width(), b.height());
    } else if (overflow(r.y(), r.height(), b.y(), b.height()) > GeometryEpsilon) {
        r.moveTop(placeOnAxis(r.y(), r.height(), b.y(), b.height()));
    }

    // 3. Minimum size
    if (r.width() < minimumSize.width() || r.height() < minimumSize.height()) {
        r.setSize(QSizeF(std::max(r.width(), minimumSize.width()), std::max(r.height(), minimumSize.height())));
        r = GeometryUtils::translateInto(r, b);
    }

    return r;
}

bool BoundaryCorrector::needsCorrection(const QRectF &frame, const QRectF &bounds, const QSizeF &minimumSize)
{
    return !fuzzyEqual(correct(frame, bounds, minimumSize), frame);
}

LayoutResult BoundaryCorrector::correctAll(const LayoutResult &frames, const QRectF &bounds, const QSizeF &minimumSize)
{
    LayoutResult corrected;
    corrected.reserve(frames.size());
    int changed = 0;
    for (const QRectF &frame : frames) {
        const QRectF fixed = correct(frame, bounds, minimumSize);
        if (!fuzzyEqual(fixed, frame)) {
            ++changed;
        }
        corrected.append(fixed);
    }
    if (changed > 0) {
        qCDebug(lcCorrector) << "correctAll:" << changed << "of" << frames.size() << "frames corrected into" << bounds;
    }
    return corrected;
}

} // namespace PlasmaArrange
