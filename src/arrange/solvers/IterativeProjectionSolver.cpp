// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ConstraintSolvers.h"
#include "core/constants.h"
#include "core/logging.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace {

struct Span
{
    qreal x;
    qreal width;

    qreal right() const
    {
        return x + width;
    }
};

QVector<Span> goldenSpans(int count, const QRectF &area)
{
    const qreal total = std::max(area.width(), 0.0);
    const qreal minimumWidth = ProjectionFloorFraction * total / count;
    const qreal distributable = total - minimumWidth * count;

    QVector<qreal> weights;
    weights.reserve(count);
    qreal weightSum = 0.0;
    for (int i = 0; i < count; ++i) {
        const qreal w = std::pow(InverseGoldenRatio, i);
        weights.append(w);
        weightSum += w;
    }

    QVector<Span> spans;
    spans.reserve(count);
    qreal x = area.x();
    for (int i = 0; i < count; ++i) {
        const qreal width = (i == count - 1) ? area.x() + total - x : minimumWidth + distributable * weights[i] / weightSum;
        spans.append({x, width});
        x += width;
    }
    return spans;
}

// Golden spans handed out in the left-to-right order of the prior frames
QVector<Span> seededSpans(const QVector<QRectF> &priorFrames, const QRectF &area)
{
    const int count = priorFrames.size();
    QVector<int> order(count);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&priorFrames](int a, int b) {
        return priorFrames[a].center().x() < priorFrames[b].center().x();
    });

    const QVector<Span> golden = goldenSpans(count, area);
    QVector<Span> spans(count);
    for (int rank = 0; rank < count; ++rank) {
        spans[order[rank]] = golden[rank];
    }
    return spans;
}

} // namespace

LayoutResult ConstraintSolvers::iterativeProjection(int windowCount, const QRectF &area, qreal overlapTolerance,
                                                    const QVector<QRectF> &priorFrames)
{
    LayoutResult rects;
    if (windowCount <= 0) {
        return rects;
    }

    QVector<Span> spans = priorFrames.size() == windowCount ? seededSpans(priorFrames, area)
                                                             : goldenSpans(windowCount, area);

    // Adjacency follows horizontal position, which differs from input order
    // when seeded
    QVector<int> order(windowCount);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&spans](int a, int b) {
        return spans[a].x < spans[b].x;
    });

    const qreal left = area.x();
    const qreal right = area.x() + std::max(area.width(), 0.0);
    overlapTolerance = std::max(overlapTolerance, 0.0);

    auto worstOverlap = [&spans, &order]() {
        qreal worst = 0.0;
        for (int k = 0; k + 1 < order.size(); ++k) {
            worst = std::max(worst, spans[order[k]].right() - spans[order[k + 1]].x);
        }
        return worst;
    };

    int pass = 0;
    for (; pass < ProjectionMaxPasses && worstOverlap() > overlapTolerance; ++pass) {
        for (int k = 0; k + 1 < order.size(); ++k) {
            Span &a = spans[order[k]];
            Span &b = spans[order[k + 1]];
            const qreal overlap = a.right() - b.x;
            if (overlap <= overlapTolerance) {
                continue;
            }
            const qreal half = overlap / 2.0;

            if (a.x - half >= left) {
                a.x -= half;
            } else {
                a.width = std::max(a.width - half, 0.0);
            }

            if (b.right() + half <= right) {
                b.x += half;
            } else {
                const qreal shrink = std::min(half, b.width);
                b.x += shrink;
                b.width -= shrink;
            }
        }
    }

    const qreal remaining = worstOverlap();
    if (remaining > overlapTolerance) {
        qCWarning(lcSolver) << "iterativeProjection: overlap of" << remaining << "remains after" << pass << "passes";
    } else {
        qCDebug(lcSolver) << "iterativeProjection:" << windowCount << "windows settled after" << pass << "passes";
    }

    rects.reserve(windowCount);
    for (const Span &s : spans) {
        rects.append(QRectF(s.x, area.y(), s.width, std::max(area.height(), 0.0)));
    }
    return rects;
}

} // namespace PlasmaArrange
