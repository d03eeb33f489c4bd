// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmaarrange_export.h"
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>
#include <optional>

namespace PlasmaArrange {

/**
 * @brief Single-window placement presets
 *
 * Each preset maps to a fixed fraction of the usable frame.
 */
enum class SnapPosition {
    LeftHalf,
    RightHalf,
    TopHalf,
    BottomHalf,

    TopLeftQuarter,
    TopRightQuarter,
    BottomLeftQuarter,
    BottomRightQuarter,

    LeftThird,
    CenterThird,
    RightThird,

    LeftTwoThirds,
    RightTwoThirds,

    Center,  ///< 70% of the usable frame on each axis, centred
    Maximize ///< The whole usable frame
};

namespace SnapPositions {

/**
 * @brief All presets in declaration order
 */
PLASMAARRANGE_EXPORT QVector<SnapPosition> all();

/**
 * @brief Stable identifier (e.g. "left_half")
 */
PLASMAARRANGE_EXPORT QString id(SnapPosition position);

/**
 * @brief Parse an identifier produced by id()
 */
PLASMAARRANGE_EXPORT std::optional<SnapPosition> fromId(const QString &id);

/**
 * @brief Translated, human-readable name
 */
PLASMAARRANGE_EXPORT QString displayName(SnapPosition position);

/**
 * @brief Target frame of a preset inside the usable frame
 */
PLASMAARRANGE_EXPORT QRectF geometry(SnapPosition position, const QRectF &usableFrame);

/**
 * @brief Preset selected by releasing a drag at a point near a screen edge
 *
 * Left/right edges win over top/bottom. Near the top or bottom edge, a point
 * within twice the threshold of a side edge selects the matching quarter.
 *
 * @param point Pointer position in screen coordinates
 * @param usableFrame Usable frame of the screen under the pointer
 * @param threshold Edge distance in pixels
 * @return The preset, or std::nullopt when the point is not near any edge
 */
PLASMAARRANGE_EXPORT std::optional<SnapPosition> detect(const QPointF &point, const QRectF &usableFrame,
                                                         qreal threshold);

} // namespace SnapPositions

} // namespace PlasmaArrange
