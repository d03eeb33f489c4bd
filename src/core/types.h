// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "constants.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QVector>

namespace PlasmaArrange {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared value types for the layout engine
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Opaque identifier of an external window
 *
 * The engine never inspects a handle; it only counts and orders them and
 * hands them back to the Window Sink.
 */
using WindowHandle = QString;

/**
 * @brief Ordered target rectangles, index-aligned with the input windows
 */
using LayoutResult = QVector<QRectF>;

/**
 * @brief A layout container
 *
 * fullFrame is the whole display; usableFrame excludes reserved chrome
 * (panels, docks, menu bars) and is the authoritative container for layout.
 */
struct PLASMAARRANGE_EXPORT Screen
{
    QString name;       ///< Display name (informational only)
    QRectF fullFrame;   ///< Entire display area
    QRectF usableFrame; ///< Area available for windows, always inside fullFrame

    /**
     * @brief Build a screen, clipping the usable frame into the full frame
     *
     * A usable frame that does not intersect the full frame collapses to a
     * zero-size rect at the full frame's origin.
     */
    static Screen fromFrames(const QRectF &fullFrame, const QRectF &usableFrame,
                             const QString &name = QString());

    /**
     * @brief Build a screen whose usable frame equals its full frame
     */
    static Screen fromGeometry(const QRectF &geometry, const QString &name = QString());

    /**
     * @brief Width / height of the usable frame, 0 for a degenerate frame
     */
    qreal aspectRatio() const noexcept;

    /**
     * @brief Portrait orientation (usable height exceeds usable width)
     */
    bool isVertical() const noexcept;

    bool operator==(const Screen &other) const;
};

/**
 * @brief Plain numeric settings consumed by the mode functions
 *
 * Derived from ArrangeConfig by the caller; the engine keeps no settings
 * state of its own.
 */
struct PLASMAARRANGE_EXPORT LayoutSettings
{
    qreal padding = ArrangeDefaults::GridPadding;          ///< Grid inset from every edge
    qreal dockClearance = ArrangeDefaults::DockClearance;  ///< Extra grid inset at the bottom edge
    QSizeF minimumSize{ArrangeDefaults::MinimumWindowWidth, ArrangeDefaults::MinimumWindowHeight};
    qreal overlapTolerance = ArrangeDefaults::OverlapTolerance; ///< Projection solver overlap allowance
    qreal snapThreshold = ArrangeDefaults::SnapThreshold;       ///< Edge distance that snaps a dropped window
};

} // namespace PlasmaArrange
