// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "LayoutMode.h"
#include "core/constants.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace PlasmaArrange {

/**
 * @brief Discovery and metadata for layout modes
 *
 * The registry is a read-only table compiled into the library: one entry per
 * LayoutMode, in declaration order. It carries the stable identifier used in
 * configuration and on the command line, the translated display name and
 * description, an icon name and the family.
 *
 * Usage:
 * @code
 * if (const auto mode = LayoutModeRegistry::modeFromId(QStringLiteral("focus"))) {
 *     const LayoutResult rects = LayoutEngine::calculate({*mode, windowCount, screen, settings});
 * }
 * @endcode
 *
 * @see LayoutEngine for the single dispatch over all modes
 */
namespace LayoutModeRegistry {

/**
 * @brief All modes in registration (declaration) order
 */
PLASMAARRANGE_EXPORT QVector<LayoutMode> allModes();

/**
 * @brief Modes belonging to one family, in registration order
 */
PLASMAARRANGE_EXPORT QVector<LayoutMode> modesInFamily(LayoutFamily family);

/**
 * @brief Identifiers of all modes in registration order
 */
PLASMAARRANGE_EXPORT QStringList availableModeIds();

/**
 * @brief Stable identifier of a mode (e.g. "focus", "iterative-projection")
 */
PLASMAARRANGE_EXPORT QString modeId(LayoutMode mode);

/**
 * @brief Look up a mode by identifier
 * @return The mode, or std::nullopt for an unknown identifier
 */
PLASMAARRANGE_EXPORT std::optional<LayoutMode> modeFromId(const QString &id);

PLASMAARRANGE_EXPORT QString displayName(LayoutMode mode);
PLASMAARRANGE_EXPORT QString description(LayoutMode mode);
PLASMAARRANGE_EXPORT QString icon(LayoutMode mode);
PLASMAARRANGE_EXPORT LayoutFamily family(LayoutMode mode);

/**
 * @brief Identifier of a family ("basic", "profile", "solver", "adaptive")
 */
PLASMAARRANGE_EXPORT QString familyId(LayoutFamily family);

/**
 * @brief Whether the mode inspects the screen aspect ratio
 *
 * Ultrawide-aware modes fall back to Focus on screens narrower than
 * LayoutConstants::UltrawideAspectThreshold.
 */
PLASMAARRANGE_EXPORT bool isUltrawideAware(LayoutMode mode);

/**
 * @brief Mode used when nothing else is configured
 */
PLASMAARRANGE_EXPORT LayoutMode defaultMode() noexcept;

/**
 * @brief Relative preview of a mode for mode pickers
 *
 * Runs the mode on a square preview canvas with no padding and returns each
 * rect normalised to 0.0-1.0 of the canvas.
 *
 * @param mode Mode to preview
 * @param windowCount Number of windows to show
 */
PLASMAARRANGE_EXPORT QVector<QRectF> previewGeometry(LayoutMode mode,
                                                     int windowCount = LayoutConstants::PreviewWindowCount);

} // namespace LayoutModeRegistry

} // namespace PlasmaArrange
