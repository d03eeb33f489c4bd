// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace PlasmaArrange {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "plasmaarrange.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcGeometry, "plasmaarrange.core.geometry", QtInfoMsg)

// Layout module categories
Q_LOGGING_CATEGORY(lcLayout, "plasmaarrange.layout", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSolver, "plasmaarrange.layout.solver", QtInfoMsg)

// Correction and orchestration categories
Q_LOGGING_CATEGORY(lcCorrector, "plasmaarrange.corrector", QtInfoMsg)
Q_LOGGING_CATEGORY(lcArrange, "plasmaarrange.arrange", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "plasmaarrange.config", QtInfoMsg)

// Command-line front end categories
Q_LOGGING_CATEGORY(lcCli, "plasmaarrange.cli", QtInfoMsg)

} // namespace PlasmaArrange
