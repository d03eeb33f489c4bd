// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include "constants.h"
#include <algorithm>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace GeometryUtils {

namespace {
/// Place a span of the given length inside [boundStart, boundStart + boundLength]
/// with the smallest move; oversized spans align to boundStart.
qreal clampStart(qreal start, qreal length, qreal boundStart, qreal boundLength)
{
    if (length >= boundLength) {
        return boundStart;
    }
    return std::clamp(start, boundStart, boundStart + boundLength - length);
}
} // namespace

bool contains(const QRectF &outer, const QRectF &inner)
{
    const QRectF o = outer.normalized();
    const QRectF i = inner.normalized();
    return i.left() >= o.left() - GeometryEpsilon
        && i.top() >= o.top() - GeometryEpsilon
        && i.right() <= o.right() + GeometryEpsilon
        && i.bottom() <= o.bottom() + GeometryEpsilon;
}

QRectF intersection(const QRectF &a, const QRectF &b)
{
    const QRectF na = a.normalized();
    const QRectF nb = b.normalized();

    const qreal left = std::max(na.left(), nb.left());
    const qreal top = std::max(na.top(), nb.top());
    const qreal right = std::min(na.right(), nb.right());
    const qreal bottom = std::min(na.bottom(), nb.bottom());

    if (right <= left || bottom <= top) {
        return QRectF();
    }
    return QRectF(left, top, right - left, bottom - top);
}

qreal area(const QRectF &rect)
{
    if (rect.width() <= 0 || rect.height() <= 0) {
        return 0.0;
    }
    return rect.width() * rect.height();
}

qreal overlapArea(const QRectF &a, const QRectF &b)
{
    return area(intersection(a, b));
}

qreal aspectRatio(const QRectF &rect)
{
    if (rect.height() <= 0 || rect.width() <= 0) {
        return 0.0;
    }
    return rect.width() / rect.height();
}

QRectF clampInto(const QRectF &rect, const QRectF &bounds)
{
    const QRectF r = rect.normalized();
    const QRectF b = bounds.normalized();

    const qreal width = std::min(r.width(), b.width());
    const qreal height = std::min(r.height(), b.height());
    const qreal x = clampStart(r.x(), width, b.x(), b.width());
    const qreal y = clampStart(r.y(), height, b.y(), b.height());
    return QRectF(x, y, width, height);
}

QRectF translateInto(const QRectF &rect, const QRectF &bounds)
{
    const QRectF r = rect.normalized();
    const QRectF b = bounds.normalized();

    const qreal x = clampStart(r.x(), r.width(), b.x(), b.width());
    const qreal y = clampStart(r.y(), r.height(), b.y(), b.height());
    return QRectF(x, y, r.width(), r.height());
}

QRectF centered(const QSizeF &size, const QRectF &within)
{
    const QRectF w = within.normalized();
    const qreal width = std::max<qreal>(0.0, size.width());
    const qreal height = std::max<qreal>(0.0, size.height());
    return QRectF(w.center().x() - width / 2.0, w.center().y() - height / 2.0, width, height);
}

QRect snapToRect(const QRectF &rf)
{
    // QRectF uses exclusive right/bottom: right = x + width.
    const int left = qRound(rf.x());
    const int top = qRound(rf.y());
    const int right = qRound(rf.x() + rf.width());
    const int bottom = qRound(rf.y() + rf.height());
    return QRect(left, top, std::max(0, right - left), std::max(0, bottom - top));
}

} // namespace GeometryUtils

} // namespace PlasmaArrange
