// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"
#include "geometryutils.h"

namespace PlasmaArrange {

Screen Screen::fromFrames(const QRectF &fullFrame, const QRectF &usableFrame, const QString &name)
{
    Screen screen;
    screen.name = name;
    screen.fullFrame = fullFrame.normalized();

    const QRectF clipped = GeometryUtils::intersection(screen.fullFrame, usableFrame.normalized());
    screen.usableFrame = clipped.isEmpty() ? QRectF(screen.fullFrame.topLeft(), QSizeF(0, 0)) : clipped;
    return screen;
}

Screen Screen::fromGeometry(const QRectF &geometry, const QString &name)
{
    return fromFrames(geometry, geometry, name);
}

qreal Screen::aspectRatio() const noexcept
{
    return GeometryUtils::aspectRatio(usableFrame);
}

bool Screen::isVertical() const noexcept
{
    return usableFrame.height() > usableFrame.width();
}

bool Screen::operator==(const Screen &other) const
{
    return name == other.name && fullFrame == other.fullFrame && usableFrame == other.usableFrame;
}

} // namespace PlasmaArrange
