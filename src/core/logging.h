// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmaarrange_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for PlasmaArrange
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcLayout) << "Debug message";
 *   qCWarning(lcArrange) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="plasmaarrange.*=true"                 # Enable all
 *   QT_LOGGING_RULES="plasmaarrange.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="plasmaarrange.layout.solver=true"     # Enable solvers only
 *
 * Severity Guidelines:
 *   qCDebug    - Per-invocation tracing (mode, count, solver passes)
 *   qCInfo     - Arrange run summaries
 *   qCWarning  - Sink failures, unknown modes, invalid configuration values
 *   qCCritical - Not used by the engine (every operation is total)
 */

namespace PlasmaArrange {

// Core module - geometry kernel, screens, window interfaces
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcGeometry)

// Layout module - mode registry, profiles, solvers
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcLayout)
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSolver)

// Boundary corrector and orchestration
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCorrector)
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcArrange)

// Configuration loading
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Command-line front end
PLASMAARRANGE_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCli)

} // namespace PlasmaArrange
