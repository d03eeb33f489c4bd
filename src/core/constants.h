// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QtGlobal>

namespace PlasmaArrange {

/**
 * @brief Structural constants for the layout engine
 *
 * These values shape the built-in layout modes and solvers and are not user
 * configurable. User-adjustable values (padding, minimum size, thresholds)
 * live in ArrangeDefaults and flow through ArrangeConfig / LayoutSettings.
 */
namespace LayoutConstants {
// Comparisons on floating-point screen coordinates
constexpr qreal GeometryEpsilon = 1e-6;

// Master-stack ratios
constexpr qreal InverseGoldenRatio = 0.6180339887498949; // φ⁻¹
constexpr qreal FocusMainRatio = 2.0 / 3.0;

// Cascade
constexpr qreal CascadeOffset = 30.0;
constexpr qreal CascadeSizeFraction = 0.7;
constexpr qreal CascadeMaxWidth = 1000.0;
constexpr qreal CascadeMaxHeight = 700.0;

// Ultrawide-aware modes delegate to Focus below this width/height ratio
constexpr qreal UltrawideAspectThreshold = 2.0;
constexpr qreal UltrawideSingleFraction = 0.5;
constexpr qreal UltrawideSingleMaxWidth = 1600.0;
constexpr qreal UltrawidePairCenterFraction = 0.6;
constexpr qreal UltrawidePairSideFraction = 0.25;
constexpr qreal UltrawideSideColumnFraction = 0.25;

// Video-style single window (communication, video conference)
constexpr qreal VideoAspectRatio = 16.0 / 9.0;
constexpr qreal VideoMaxWidthFraction = 0.8;

// Adaptive multi-task: 5-6 windows use a fixed 3x2 grid
constexpr int MultiTaskGridColumns = 3;
constexpr int MultiTaskGridRows = 2;
constexpr int QuadrantCount = 4;

// Iterative projection solver
constexpr int ProjectionMaxPasses = 10;
constexpr qreal ProjectionFloorFraction = 0.5; ///< Floor width as a fraction of an equal share

// Interior-point solver
constexpr qreal BarrierMarginFraction = 0.05;
constexpr qreal BarrierMarginFloor = 8.0;
constexpr qreal BarrierMinUsableWidth = 320.0;
constexpr qreal BarrierMinUsableHeight = 240.0;

// Active-set solver
constexpr qreal ActiveSetBoundaryTolerance = 1.0;
constexpr qreal ActiveSetCentralFraction = 0.6;

// Relaxation solver
constexpr qreal RelaxationFactor = 0.7;
constexpr int RelaxationMaxPasses = 20;
constexpr qreal RelaxationTolerance = 0.5;
constexpr qreal RelaxationInsetFraction = 0.01;
constexpr qreal RelaxationSpacingFraction = 0.005;

// Pivot expansion solver
constexpr int PivotMaxIterations = 12;
constexpr qreal PivotIncrementFraction = 0.02;
constexpr qreal PivotSoftCapFactor = 1.5;
constexpr qreal PivotFloorFactor = 0.5;

// Boundary corrector: oversized windows shrink to this fraction of the screen
constexpr qreal OverflowShrinkFraction = 0.95;

// Snap presets
constexpr qreal CenterSnapFraction = 0.7;

// Window reset
constexpr qreal ResetWindowWidth = 800.0;
constexpr qreal ResetWindowHeight = 600.0;
constexpr qreal ResetWindowOffset = 30.0;

// Preview generation (normalised to a square preview canvas)
constexpr int PreviewWindowCount = 3;
constexpr int PreviewSize = 1000;
} // namespace LayoutConstants

/**
 * @brief Defaults and valid ranges for user-adjustable values
 *
 * @note ArrangeConfig's member initialisers must match these values.
 */
namespace ArrangeDefaults {
constexpr int GridPadding = 10;
constexpr int MinGridPadding = 5;
constexpr int MaxGridPadding = 30;

constexpr int DockClearance = 0;
constexpr int MinDockClearance = 0;
constexpr int MaxDockClearance = 200;

constexpr int MinimumWindowWidth = 200;
constexpr int MinimumWindowHeight = 150;
constexpr int MinimumWindowFloor = 50;
constexpr int MaximumWindowFloor = 2000;

constexpr int OverlapTolerance = 5;
constexpr int MinOverlapTolerance = 0;
constexpr int MaxOverlapTolerance = 50;

constexpr int SnapThreshold = 20;
constexpr int MinSnapThreshold = 10;
constexpr int MaxSnapThreshold = 50;
} // namespace ArrangeDefaults

/**
 * @brief KConfig group and key names for ArrangeConfig
 */
namespace ArrangeConfigKeys {
inline constexpr char Group[] = "Arrange";
inline constexpr char DefaultMode[] = "DefaultMode";
inline constexpr char GridPadding[] = "GridPadding";
inline constexpr char DockClearance[] = "DockClearance";
inline constexpr char MinimumWindowWidth[] = "MinimumWindowWidth";
inline constexpr char MinimumWindowHeight[] = "MinimumWindowHeight";
inline constexpr char OverlapTolerance[] = "OverlapTolerance";
inline constexpr char SnapThreshold[] = "SnapThreshold";
} // namespace ArrangeConfigKeys

} // namespace PlasmaArrange
