// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace PlasmaArrange {

/**
 * @brief Grouping of layout modes for discovery and UI sections
 */
enum class LayoutFamily {
    Basic,            ///< Simple partitions (grid, strips, cascade, master-stack)
    WorkspaceProfile, ///< Role-proportioned presets for a fixed scenario
    ConstraintSolver, ///< Iterative refinement of an initial partition
    Adaptive          ///< Count- or geometry-dependent dispatch
};

/**
 * @brief Every layout strategy the engine knows
 *
 * Closed set: LayoutEngine::calculate() handles each case exactly once.
 * Metadata (identifier, name, family) lives in LayoutModeRegistry.
 */
enum class LayoutMode {
    // Basic
    Grid,
    Horizontal,
    Vertical,
    Cascade,
    Fibonacci,
    Focus,

    // Workspace profiles
    Reading,
    Coding,
    Design,
    Communication,
    Presentation,
    VideoConference,
    DataAnalysis,
    ContentCreation,
    Trading,
    GamingStreaming,
    Learning,
    ProjectManagement,
    Monitoring,
    FullStackDev,
    MobileDev,
    DevOps,
    MlAiDev,
    GameDev,
    FrontendDev,
    BackendApi,
    DesktopAppDev,

    // Adaptive
    Research,
    MultiTask,
    UltraWide,

    // Constraint solvers
    IterativeProjection,
    InteriorPoint,
    ActiveSet,
    Relaxation,
    PivotExpansion
};

} // namespace PlasmaArrange
