// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "arrange/LayoutMode.h"
#include "core/types.h"
#include "plasmaarrange_export.h"
#include <QRectF>
#include <QString>
#include <QVector>

namespace PlasmaArrange {

/**
 * @brief Direction in which a profile divides the usable frame
 */
enum class SplitAxis {
    Columns, ///< Slots side by side, full height
    Rows     ///< Slots stacked, full width
};

/**
 * @brief Placement of the only window when a profile receives one window
 */
enum class SingleWindowRule {
    Fill,         ///< The whole usable frame
    Centered,     ///< Centred column: widthFraction of the frame, capped at maxWidth, full height
    CenteredVideo ///< Centred 16:9 rect, at most 80% of the frame width
};

/**
 * @brief Single-window rule with its parameters
 *
 * widthFraction and maxWidth are read by SingleWindowRule::Centered only;
 * a maxWidth of 0 leaves the column uncapped.
 */
struct SingleWindowPlacement
{
    SingleWindowRule rule;
    qreal widthFraction;
    qreal maxWidth;
};

/**
 * @brief One role region of a workspace profile
 */
struct ProfileSlot
{
    QString role;    ///< What the slot is meant for ("editor", "terminal", ...)
    qreal fraction;  ///< Share of the split axis
};

/**
 * @brief Role-proportioned preset consumed by WorkspaceProfiles::arrange()
 *
 * Slots are listed in screen order (left to right, or top to bottom).
 * fillOrder lists slot indices in the order windows claim them; the first
 * window goes to the most important slot. An empty fillOrder means screen
 * order. Every table entry states its single-window placement.
 */
struct PLASMAARRANGE_EXPORT WorkspaceProfile
{
    LayoutMode mode;
    SplitAxis axis;
    QVector<ProfileSlot> slots;
    QVector<int> fillOrder;
    SingleWindowPlacement singleWindow;

    /**
     * @brief Slot index claimed by the i-th window, for i < slots.size()
     */
    int slotForWindow(int index) const;
};

/**
 * @brief Workspace profile table and its generic executor
 *
 * Layout rules for a profile with K slots and n windows:
 * - n == 0: no rects.
 * - n == 1: the profile's single-window rule.
 * - 2 <= n <= K: the first n slots in fill order, their fractions normalised,
 *   laid out in screen order; window i takes the i-th slot in fill order.
 * - n > K: all K slots; the last slot in fill order is shared by window K-1
 *   and every extra window, dividing its cross-axis equally.
 */
namespace WorkspaceProfiles {

/**
 * @brief Modes backed by a profile, in table order
 */
PLASMAARRANGE_EXPORT QVector<LayoutMode> profileModes();

/**
 * @brief The profile for a mode
 * @return Pointer into the static table, or nullptr if the mode has no profile
 */
PLASMAARRANGE_EXPORT const WorkspaceProfile *profile(LayoutMode mode);

/**
 * @brief Run the generic executor over one profile
 */
PLASMAARRANGE_EXPORT LayoutResult arrange(const WorkspaceProfile &profile, int windowCount, const QRectF &area);

/**
 * @brief Look up the mode's profile and run it
 * @return The layout, or an empty result for a mode without a profile
 */
PLASMAARRANGE_EXPORT LayoutResult calculate(LayoutMode mode, int windowCount, const QRectF &area);

} // namespace WorkspaceProfiles

} // namespace PlasmaArrange
