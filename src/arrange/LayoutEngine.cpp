// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "LayoutEngine.h"
#include "BoundaryCorrector.h"
#include "LayoutModeRegistry.h"
#include "algorithms/AdaptiveLayouts.h"
#include "algorithms/BasicLayouts.h"
#include "algorithms/WorkspaceProfiles.h"
#include "solvers/ConstraintSolvers.h"
#include "core/constants.h"
#include "core/logging.h"

namespace PlasmaArrange {

bool LayoutEngine::fallsBackToFocus(LayoutMode mode, const Screen &screen)
{
    return LayoutModeRegistry::isUltrawideAware(mode)
        && screen.aspectRatio() < LayoutConstants::UltrawideAspectThreshold;
}

LayoutResult LayoutEngine::calculate(const LayoutRequest &request)
{
    const int n = request.windowCount;
    if (n <= 0) {
        return {};
    }

    const QRectF &area = request.screen.usableFrame;
    const LayoutSettings &settings = request.settings;

    if (fallsBackToFocus(request.mode, request.screen)) {
        qCDebug(lcLayout) << "LayoutEngine::calculate:" << LayoutModeRegistry::modeId(request.mode)
                          << "on aspect" << request.screen.aspectRatio() << "- using focus";
        return BasicLayouts::focus(n, area);
    }

    qCDebug(lcLayout) << "LayoutEngine::calculate:" << LayoutModeRegistry::modeId(request.mode) << n << "windows in"
                      << area;

    switch (request.mode) {
    case LayoutMode::Grid:
        return BasicLayouts::grid(n, area, settings);
    case LayoutMode::Horizontal:
        return BasicLayouts::horizontal(n, area);
    case LayoutMode::Vertical:
        return BasicLayouts::vertical(n, area);
    case LayoutMode::Cascade:
        return BasicLayouts::cascade(n, area);
    case LayoutMode::Fibonacci:
        return BasicLayouts::fibonacci(n, area);
    case LayoutMode::Focus:
        return BasicLayouts::focus(n, area);

    case LayoutMode::Reading:
    case LayoutMode::Coding:
    case LayoutMode::Design:
    case LayoutMode::Communication:
    case LayoutMode::Presentation:
    case LayoutMode::VideoConference:
    case LayoutMode::DataAnalysis:
    case LayoutMode::ContentCreation:
    case LayoutMode::Trading:
    case LayoutMode::GamingStreaming:
    case LayoutMode::Learning:
    case LayoutMode::ProjectManagement:
    case LayoutMode::Monitoring:
    case LayoutMode::FullStackDev:
    case LayoutMode::MobileDev:
    case LayoutMode::DevOps:
    case LayoutMode::MlAiDev:
    case LayoutMode::GameDev:
    case LayoutMode::FrontendDev:
    case LayoutMode::BackendApi:
    case LayoutMode::DesktopAppDev:
        return WorkspaceProfiles::calculate(request.mode, n, area);

    case LayoutMode::Research:
        return AdaptiveLayouts::research(n, area);
    case LayoutMode::MultiTask:
        return AdaptiveLayouts::multiTask(n, area, settings);
    case LayoutMode::UltraWide:
        return AdaptiveLayouts::ultraWide(n, area);

    case LayoutMode::IterativeProjection:
        return ConstraintSolvers::iterativeProjection(n, area, settings.overlapTolerance, request.priorFrames);
    case LayoutMode::InteriorPoint:
        return ConstraintSolvers::interiorPoint(n, area, settings);
    case LayoutMode::ActiveSet:
        return ConstraintSolvers::activeSet(n, area);
    case LayoutMode::Relaxation:
        return ConstraintSolvers::relaxation(n, area);
    case LayoutMode::PivotExpansion:
        return ConstraintSolvers::pivotExpansion(n, area);
    }

    qCWarning(lcLayout) << "LayoutEngine::calculate: unhandled mode" << static_cast<int>(request.mode);
    return {};
}

LayoutResult LayoutEngine::calculateCorrected(const LayoutRequest &request)
{
    return BoundaryCorrector::correctAll(calculate(request), request.screen.usableFrame,
                                         request.settings.minimumSize);
}

} // namespace PlasmaArrange
