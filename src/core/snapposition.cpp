// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snapposition.h"
#include "constants.h"
#include "geometryutils.h"
#include <KLocalizedString>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace SnapPositions {

QVector<SnapPosition> all()
{
    return {SnapPosition::LeftHalf,       SnapPosition::RightHalf,         SnapPosition::TopHalf,
            SnapPosition::BottomHalf,     SnapPosition::TopLeftQuarter,    SnapPosition::TopRightQuarter,
            SnapPosition::BottomLeftQuarter, SnapPosition::BottomRightQuarter, SnapPosition::LeftThird,
            SnapPosition::CenterThird,    SnapPosition::RightThird,        SnapPosition::LeftTwoThirds,
            SnapPosition::RightTwoThirds, SnapPosition::Center,            SnapPosition::Maximize};
}

QString id(SnapPosition position)
{
    switch (position) {
    case SnapPosition::LeftHalf:
        return QStringLiteral("left_half");
    case SnapPosition::RightHalf:
        return QStringLiteral("right_half");
    case SnapPosition::TopHalf:
        return QStringLiteral("top_half");
    case SnapPosition::BottomHalf:
        return QStringLiteral("bottom_half");
    case SnapPosition::TopLeftQuarter:
        return QStringLiteral("top_left_quarter");
    case SnapPosition::TopRightQuarter:
        return QStringLiteral("top_right_quarter");
    case SnapPosition::BottomLeftQuarter:
        return QStringLiteral("bottom_left_quarter");
    case SnapPosition::BottomRightQuarter:
        return QStringLiteral("bottom_right_quarter");
    case SnapPosition::LeftThird:
        return QStringLiteral("left_third");
    case SnapPosition::CenterThird:
        return QStringLiteral("center_third");
    case SnapPosition::RightThird:
        return QStringLiteral("right_third");
    case SnapPosition::LeftTwoThirds:
        return QStringLiteral("left_two_thirds");
    case SnapPosition::RightTwoThirds:
        return QStringLiteral("right_two_thirds");
    case SnapPosition::Center:
        return QStringLiteral("center");
    case SnapPosition::Maximize:
        return QStringLiteral("maximize");
    }
    return QString();
}

std::optional<SnapPosition> fromId(const QString &id)
{
    const auto positions = all();
    for (SnapPosition position : positions) {
        if (SnapPositions::id(position) == id) {
            return position;
        }
    }
    return std::nullopt;
}

QString displayName(SnapPosition position)
{
    switch (position) {
    case SnapPosition::LeftHalf:
        return i18n("Left Half");
    case SnapPosition::RightHalf:
        return i18n("Right Half");
    case SnapPosition::TopHalf:
        return i18n("Top Half");
    case SnapPosition::BottomHalf:
        return i18n("Bottom Half");
    case SnapPosition::TopLeftQuarter:
        return i18n("Top Left Quarter");
    case SnapPosition::TopRightQuarter:
        return i18n("Top Right Quarter");
    case SnapPosition::BottomLeftQuarter:
        return i18n("Bottom Left Quarter");
    case SnapPosition::BottomRightQuarter:
        return i18n("Bottom Right Quarter");
    case SnapPosition::LeftThird:
        return i18n("Left Third");
    case SnapPosition::CenterThird:
        return i18n("Center Third");
    case SnapPosition::RightThird:
        return i18n("Right Third");
    case SnapPosition::LeftTwoThirds:
        return i18n("Left Two Thirds");
    case SnapPosition::RightTwoThirds:
        return i18n("Right Two Thirds");
    case SnapPosition::Center:
        return i18n("Center");
    case SnapPosition::Maximize:
        return i18n("Maximize");
    }
    return QString();
}

QRectF geometry(SnapPosition position, const QRectF &usableFrame)
{
    const QRectF f = usableFrame.normalized();
    const qreal x = f.x();
    const qreal y = f.y();
    const qreal w = f.width();
    const qreal h = f.height();

    switch (position) {
    case SnapPosition::LeftHalf:
        return QRectF(x, y, w / 2, h);
    case SnapPosition::RightHalf:
        return QRectF(x + w / 2, y, w / 2, h);
    case SnapPosition::TopHalf:
        return QRectF(x, y, w, h / 2);
    case SnapPosition::BottomHalf:
        return QRectF(x, y + h / 2, w, h / 2);

    case SnapPosition::TopLeftQuarter:
        return QRectF(x, y, w / 2, h / 2);
    case SnapPosition::TopRightQuarter:
        return QRectF(x + w / 2, y, w / 2, h / 2);
    case SnapPosition::BottomLeftQuarter:
        return QRectF(x, y + h / 2, w / 2, h / 2);
    case SnapPosition::BottomRightQuarter:
        return QRectF(x + w / 2, y + h / 2, w / 2, h / 2);

    case SnapPosition::LeftThird:
        return QRectF(x, y, w / 3, h);
    case SnapPosition::CenterThird:
        return QRectF(x + w / 3, y, w / 3, h);
    case SnapPosition::RightThird:
        return QRectF(x + w * 2 / 3, y, w / 3, h);

    case SnapPosition::LeftTwoThirds:
        return QRectF(x, y, w * 2 / 3, h);
    case SnapPosition::RightTwoThirds:
        return QRectF(x + w / 3, y, w * 2 / 3, h);

    case SnapPosition::Center:
        return GeometryUtils::centered(QSizeF(w * CenterSnapFraction, h * CenterSnapFraction), f);
    case SnapPosition::Maximize:
        return f;
    }
    return f;
}

std::optional<SnapPosition> detect(const QPointF &point, const QRectF &usableFrame, qreal threshold)
{
    const QRectF f = usableFrame.normalized();
    const qreal fromLeft = point.x() - f.left();
    const qreal fromRight = f.right() - point.x();
    const qreal fromTop = point.y() - f.top();
    const qreal fromBottom = f.bottom() - point.y();

    if (fromLeft < threshold) {
        return SnapPosition::LeftHalf;
    }
    if (fromRight < threshold) {
        return SnapPosition::RightHalf;
    }
    if (fromTop < threshold) {
        if (fromLeft < threshold * 2) {
            return SnapPosition::TopLeftQuarter;
        }
        if (fromRight < threshold * 2) {
            return SnapPosition::TopRightQuarter;
        }
        return SnapPosition::TopHalf;
    }
    if (fromBottom < threshold) {
        if (fromLeft < threshold * 2) {
            return SnapPosition::BottomLeftQuarter;
        }
        if (fromRight < threshold * 2) {
            return SnapPosition::BottomRightQuarter;
        }
        return SnapPosition::BottomHalf;
    }
    return std::nullopt;
}

} // namespace SnapPositions

} // namespace PlasmaArrange
