// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "LayoutHelpers.h"
#include <algorithm>

namespace PlasmaArrange {

namespace {

// Cumulative boundaries from start to start + length, one more than weights.size()
QVector<qreal> boundaries(qreal start, qreal length, const QVector<qreal> &weights)
{
    qreal total = 0.0;
    for (qreal w : weights) {
        total += std::max(w, 0.0);
    }

    QVector<qreal> edges;
    edges.reserve(weights.size() + 1);
    edges.append(start);
    if (total <= 0.0) {
        for (int i = 0; i < weights.size(); ++i) {
            edges.append(start);
        }
        return edges;
    }

    qreal accumulated = 0.0;
    for (int i = 0; i < weights.size(); ++i) {
        accumulated += std::max(weights[i], 0.0);
        // Pin the final edge so rounding never leaves a sliver at the end
        edges.append(i == weights.size() - 1 ? start + length : start + length * accumulated / total);
    }
    return edges;
}

QVector<qreal> equalWeights(int count)
{
    return QVector<qreal>(std::max(count, 0), 1.0);
}

} // namespace

QVector<QRectF> LayoutHelpers::splitColumns(const QRectF &area, int count)
{
    return splitColumnsByFractions(area, equalWeights(count));
}

QVector<QRectF> LayoutHelpers::splitRows(const QRectF &area, int count)
{
    return splitRowsByFractions(area, equalWeights(count));
}

QVector<QRectF> LayoutHelpers::splitColumnsByFractions(const QRectF &area, const QVector<qreal> &fractions)
{
    QVector<QRectF> rects;
    if (fractions.isEmpty()) {
        return rects;
    }

    const QVector<qreal> edges = boundaries(area.x(), std::max(area.width(), 0.0), fractions);
    rects.reserve(fractions.size());
    for (int i = 0; i < fractions.size(); ++i) {
        rects.append(QRectF(edges[i], area.y(), edges[i + 1] - edges[i], std::max(area.height(), 0.0)));
    }
    return rects;
}

QVector<QRectF> LayoutHelpers::splitRowsByFractions(const QRectF &area, const QVector<qreal> &fractions)
{
    QVector<QRectF> rects;
    if (fractions.isEmpty()) {
        return rects;
    }

    const QVector<qreal> edges = boundaries(area.y(), std::max(area.height(), 0.0), fractions);
    rects.reserve(fractions.size());
    for (int i = 0; i < fractions.size(); ++i) {
        rects.append(QRectF(area.x(), edges[i], std::max(area.width(), 0.0), edges[i + 1] - edges[i]));
    }
    return rects;
}

QVector<QRectF> LayoutHelpers::gridCells(const QRectF &area, int count, int columns, int rows)
{
    QVector<QRectF> cells;
    if (count <= 0 || columns <= 0 || rows <= 0) {
        return cells;
    }

    const QVector<QRectF> cols = splitColumns(area, columns);
    const QVector<QRectF> rowRects = splitRows(area, rows);

    count = std::min(count, columns * rows);
    cells.reserve(count);
    for (int i = 0; i < count; ++i) {
        const QRectF &col = cols[i % columns];
        const QRectF &row = rowRects[i / columns];
        cells.append(QRectF(col.x(), row.y(), col.width(), row.height()));
    }
    return cells;
}

QRectF LayoutHelpers::insetRect(const QRectF &area, qreal margin, qreal extraBottom)
{
    const qreal width = std::max(area.width(), 0.0);
    const qreal height = std::max(area.height(), 0.0);
    margin = std::max(margin, 0.0);
    extraBottom = std::max(extraBottom, 0.0);

    qreal left = margin;
    qreal right = margin;
    if (left + right > width) {
        left = right = width / 2.0;
    }

    qreal top = margin;
    qreal bottom = margin + extraBottom;
    if (top + bottom > height) {
        // Keep the top/bottom proportion while collapsing to zero height
        const qreal scale = height / (top + bottom);
        top *= scale;
        bottom *= scale;
    }

    return QRectF(area.x() + left, area.y() + top, width - left - right, height - top - bottom);
}

QVector<QRectF> LayoutHelpers::masterStack(const QRectF &area, int count, qreal mainRatio)
{
    QVector<QRectF> rects;
    if (count <= 0) {
        return rects;
    }

    mainRatio = std::clamp(mainRatio, 0.0, 1.0);
    const QVector<QRectF> columns = splitColumnsByFractions(area, {mainRatio, 1.0 - mainRatio});
    rects.reserve(count);
    rects.append(columns[0]);
    if (count == 1) {
        return rects;
    }

    rects.append(splitRows(columns[1], count - 1));
    return rects;
}

} // namespace PlasmaArrange
