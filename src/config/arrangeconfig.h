// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "arrange/LayoutMode.h"
#include "core/constants.h"
#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QSize>
#include <QString>

class KConfigGroup;

namespace PlasmaArrange {

/**
 * @brief User-adjustable arrangement settings
 *
 * Plain value type owned by the caller. The engine never reads it directly;
 * layoutSettings() derives the LayoutSettings passed into each calculation.
 */
struct PLASMAARRANGE_EXPORT ArrangeConfig
{
    // ═══════════════════════════════════════════════════════════════════════
    // Mode Selection
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Identifier of the mode used when none is given explicitly
     *
     * See LayoutModeRegistry::availableModeIds() for valid values.
     */
    QString defaultMode = QStringLiteral("grid");

    // ═══════════════════════════════════════════════════════════════════════
    // Grid Spacing
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Grid inset from every edge of the usable frame, in pixels
     *
     * Range: 5 to 30
     * Default: 10
     */
    int gridPadding = ArrangeDefaults::GridPadding;

    /**
     * @brief Extra grid inset at the bottom edge, in pixels
     *
     * For docks that the platform does not exclude from the usable frame.
     * Range: 0 to 200
     * Default: 0
     */
    int dockClearance = ArrangeDefaults::DockClearance;

    // ═══════════════════════════════════════════════════════════════════════
    // Boundary Correction
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Smallest frame the boundary corrector leaves a window at
     *
     * Each dimension is at least 50.
     * Default: 200x150
     */
    QSize minimumWindowSize{ArrangeDefaults::MinimumWindowWidth, ArrangeDefaults::MinimumWindowHeight};

    /**
     * @brief Overlap the iterative projection solver accepts between neighbours
     *
     * Range: 0 to 50
     * Default: 5
     */
    int overlapTolerance = ArrangeDefaults::OverlapTolerance;

    // Edge distance for drag-to-snap detection, 10 to 50 (default 20)
    int snapThreshold = ArrangeDefaults::SnapThreshold;

    bool operator==(const ArrangeConfig &other) const;
    bool operator!=(const ArrangeConfig &other) const;

    /**
     * @brief Copy with every field forced into its valid range
     *
     * Numeric fields are clamped; an unknown defaultMode becomes "grid".
     */
    ArrangeConfig validated() const;

    /**
     * @brief Settings for LayoutEngine / WindowArranger
     */
    LayoutSettings layoutSettings() const;

    /**
     * @brief Resolved defaultMode, LayoutMode::Grid when the id is unknown
     */
    LayoutMode layoutMode() const;

    /**
     * @brief Read from a config group
     *
     * Missing keys take their defaults. Out-of-range values and unknown mode
     * ids are logged and replaced by the defaults.
     */
    static ArrangeConfig fromConfigGroup(const KConfigGroup &group);

    /**
     * @brief Write every field to a config group
     */
    void writeTo(KConfigGroup &group) const;
};

} // namespace PlasmaArrange
