// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "LayoutModeRegistry.h"
#include "LayoutEngine.h"
#include "core/logging.h"
#include <KLazyLocalizedString>
#include <KLocalizedString>
#include <array>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace {

struct ModeEntry {
    LayoutMode mode;
    LayoutFamily family;
    const char *id;
    KLazyLocalizedString name;
    KLazyLocalizedString description;
    const char *icon;
    bool ultrawideAware;
};

// One entry per LayoutMode, in declaration order (checked by entry())
const std::array<ModeEntry, 35> s_modes{{
    // Basic
    {LayoutMode::Grid, LayoutFamily::Basic, "grid", kli18n("Grid"),
     kli18n("Even grid of windows across the screen"), "view-grid-symbolic", false},
    {LayoutMode::Horizontal, LayoutFamily::Basic, "horizontal", kli18n("Horizontal"),
     kli18n("Windows side by side in equal-width columns"), "view-split-left-right", false},
    {LayoutMode::Vertical, LayoutFamily::Basic, "vertical", kli18n("Vertical"),
     kli18n("Windows stacked in equal-height rows"), "view-split-top-bottom", false},
    {LayoutMode::Cascade, LayoutFamily::Basic, "cascade", kli18n("Cascade"),
     kli18n("Overlapping windows offset diagonally"), "window-duplicate", false},
    {LayoutMode::Fibonacci, LayoutFamily::Basic, "fibonacci", kli18n("Fibonacci"),
     kli18n("Golden ratio: one large window, the rest stacked beside it"), "shape-spiral", false},
    {LayoutMode::Focus, LayoutFamily::Basic, "focus", kli18n("Focus"),
     kli18n("Main window takes two thirds, the rest share one third"), "view-left-close", false},

    // Workspace profiles
    {LayoutMode::Reading, LayoutFamily::WorkspaceProfile, "reading", kli18n("Reading"),
     kli18n("Document at a comfortable reading width with references beside it"), "view-readermode", false},
    {LayoutMode::Coding, LayoutFamily::WorkspaceProfile, "coding", kli18n("Coding"),
     kli18n("Editor with a terminal column"), "utilities-terminal", false},
    {LayoutMode::Design, LayoutFamily::WorkspaceProfile, "design", kli18n("Design"),
     kli18n("Large canvas with a tools column"), "draw-brush", false},
    {LayoutMode::Communication, LayoutFamily::WorkspaceProfile, "communication", kli18n("Communication"),
     kli18n("Video call on top, chat and notes below"), "call-start", false},
    {LayoutMode::Presentation, LayoutFamily::WorkspaceProfile, "presentation", kli18n("Presentation"),
     kli18n("Slides on top, speaker notes below"), "view-presentation", false},
    {LayoutMode::VideoConference, LayoutFamily::WorkspaceProfile, "video-conference", kli18n("Video Conference"),
     kli18n("Call window with a notes column"), "camera-web", false},
    {LayoutMode::DataAnalysis, LayoutFamily::WorkspaceProfile, "data-analysis", kli18n("Data Analysis"),
     kli18n("Notebook, dataset and charts"), "office-chart-line", false},
    {LayoutMode::ContentCreation, LayoutFamily::WorkspaceProfile, "content-creation", kli18n("Content Creation"),
     kli18n("Editor canvas with an assets column"), "applications-multimedia", false},
    {LayoutMode::Trading, LayoutFamily::WorkspaceProfile, "trading", kli18n("Trading"),
     kli18n("Main chart with order, watchlist and news columns"), "office-chart-area", true},
    {LayoutMode::GamingStreaming, LayoutFamily::WorkspaceProfile, "gaming-streaming", kli18n("Gaming & Streaming"),
     kli18n("Game with a chat and streaming controls column"), "applications-games", false},
    {LayoutMode::Learning, LayoutFamily::WorkspaceProfile, "learning", kli18n("Learning"),
     kli18n("Lesson with a notes column"), "applications-education", false},
    {LayoutMode::ProjectManagement, LayoutFamily::WorkspaceProfile, "project-management",
     kli18n("Project Management"), kli18n("Board, documents and team chat"), "view-calendar-tasks", false},
    {LayoutMode::Monitoring, LayoutFamily::WorkspaceProfile, "monitoring", kli18n("Monitoring"),
     kli18n("Four equal dashboards side by side"), "utilities-system-monitor", true},
    {LayoutMode::FullStackDev, LayoutFamily::WorkspaceProfile, "full-stack-dev", kli18n("Full-Stack Development"),
     kli18n("Editor, browser and terminal"), "code-context", false},
    {LayoutMode::MobileDev, LayoutFamily::WorkspaceProfile, "mobile-dev", kli18n("Mobile Development"),
     kli18n("IDE, device simulator and logs"), "smartphone", false},
    {LayoutMode::DevOps, LayoutFamily::WorkspaceProfile, "devops", kli18n("DevOps"),
     kli18n("Terminal on top, dashboards and logs below"), "network-server", false},
    {LayoutMode::MlAiDev, LayoutFamily::WorkspaceProfile, "ml-ai-dev", kli18n("ML/AI Development"),
     kli18n("Notebook, training monitor and terminal"), "cpu", false},
    {LayoutMode::GameDev, LayoutFamily::WorkspaceProfile, "game-dev", kli18n("Game Development"),
     kli18n("Engine viewport on top, code and console below"), "applications-development", false},
    {LayoutMode::FrontendDev, LayoutFamily::WorkspaceProfile, "frontend-dev", kli18n("Frontend Development"),
     kli18n("Editor, live preview and console"), "globe", false},
    {LayoutMode::BackendApi, LayoutFamily::WorkspaceProfile, "backend-api", kli18n("Backend & API"),
     kli18n("Editor, API client and terminal"), "network-connect", false},
    {LayoutMode::DesktopAppDev, LayoutFamily::WorkspaceProfile, "desktop-app-dev",
     kli18n("Desktop App Development"), kli18n("IDE, running application and debugger"), "debug-run", false},

    // Adaptive
    {LayoutMode::Research, LayoutFamily::Adaptive, "research", kli18n("Research"),
     kli18n("Four quadrants for comparing sources"), "view-grid", false},
    {LayoutMode::MultiTask, LayoutFamily::Adaptive, "multi-task", kli18n("Multi-Task"),
     kli18n("Arrangement chosen by the number of windows"), "view-list-tree", false},
    {LayoutMode::UltraWide, LayoutFamily::Adaptive, "ultrawide", kli18n("Ultrawide"),
     kli18n("Three columns for 21:9 and wider screens"), "video-display", true},

    // Constraint solvers
    {LayoutMode::IterativeProjection, LayoutFamily::ConstraintSolver, "iterative-projection",
     kli18n("Iterative Projection"), kli18n("Golden-ratio widths with pairwise overlap projection"),
     "distribute-horizontal", false},
    {LayoutMode::InteriorPoint, LayoutFamily::ConstraintSolver, "interior-point", kli18n("Interior Point"),
     kli18n("Grid kept inside a barrier margin from the screen edges"), "transform-scale", false},
    {LayoutMode::ActiveSet, LayoutFamily::ConstraintSolver, "active-set", kli18n("Active Set"),
     kli18n("Edge windows stay put, inner windows share the centre"), "align-horizontal-center", false},
    {LayoutMode::Relaxation, LayoutFamily::ConstraintSolver, "relaxation", kli18n("Relaxation"),
     kli18n("Columns settled by successive under-relaxed corrections"), "distribute-horizontal-gap", false},
    {LayoutMode::PivotExpansion, LayoutFamily::ConstraintSolver, "pivot-expansion", kli18n("Pivot Expansion"),
     kli18n("Columns grown greedily one pivot at a time"), "distribute-horizontal-x", false},
}};

const ModeEntry &entry(LayoutMode mode)
{
    const auto index = static_cast<std::size_t>(mode);
    Q_ASSERT(index < s_modes.size() && s_modes[index].mode == mode);
    return s_modes[index];
}

} // namespace

QVector<LayoutMode> LayoutModeRegistry::allModes()
{
    QVector<LayoutMode> modes;
    modes.reserve(static_cast<int>(s_modes.size()));
    for (const ModeEntry &e : s_modes) {
        modes.append(e.mode);
    }
    return modes;
}

QVector<LayoutMode> LayoutModeRegistry::modesInFamily(LayoutFamily family)
{
    QVector<LayoutMode> modes;
    for (const ModeEntry &e : s_modes) {
        if (e.family == family) {
            modes.append(e.mode);
        }
    }
    return modes;
}

QStringList LayoutModeRegistry::availableModeIds()
{
    QStringList ids;
    ids.reserve(static_cast<int>(s_modes.size()));
    for (const ModeEntry &e : s_modes) {
        ids.append(QLatin1String(e.id));
    }
    return ids;
}

QString LayoutModeRegistry::modeId(LayoutMode mode)
{
    return QLatin1String(entry(mode).id);
}

std::optional<LayoutMode> LayoutModeRegistry::modeFromId(const QString &id)
{
    for (const ModeEntry &e : s_modes) {
        if (id == QLatin1String(e.id)) {
            return e.mode;
        }
    }
    qCDebug(lcLayout) << "Unknown layout mode id:" << id;
    return std::nullopt;
}

QString LayoutModeRegistry::displayName(LayoutMode mode)
{
    return entry(mode).name.toString();
}

QString LayoutModeRegistry::description(LayoutMode mode)
{
    return entry(mode).description.toString();
}

QString LayoutModeRegistry::icon(LayoutMode mode)
{
    return QLatin1String(entry(mode).icon);
}

LayoutFamily LayoutModeRegistry::family(LayoutMode mode)
{
    return entry(mode).family;
}

QString LayoutModeRegistry::familyId(LayoutFamily family)
{
    switch (family) {
    case LayoutFamily::Basic:
        return QStringLiteral("basic");
    case LayoutFamily::WorkspaceProfile:
        return QStringLiteral("profile");
    case LayoutFamily::ConstraintSolver:
        return QStringLiteral("solver");
    case LayoutFamily::Adaptive:
        return QStringLiteral("adaptive");
    }
    return QString();
}

bool LayoutModeRegistry::isUltrawideAware(LayoutMode mode)
{
    return entry(mode).ultrawideAware;
}

LayoutMode LayoutModeRegistry::defaultMode() noexcept
{
    return LayoutMode::Grid;
}

QVector<QRectF> LayoutModeRegistry::previewGeometry(LayoutMode mode, int windowCount)
{
    QVector<QRectF> relative;
    if (windowCount <= 0) {
        return relative;
    }

    const qreal size = PreviewSize;
    LayoutRequest request;
    request.mode = mode;
    request.windowCount = windowCount;
    request.screen = Screen::fromGeometry(QRectF(0, 0, size, size));
    request.settings.padding = 0;
    request.settings.dockClearance = 0;

    const LayoutResult rects = LayoutEngine::calculate(request);
    relative.reserve(rects.size());
    for (const QRectF &r : rects) {
        relative.append(QRectF(r.x() / size, r.y() / size, r.width() / size, r.height() / size));
    }
    return relative;
}

} // namespace PlasmaArrange
