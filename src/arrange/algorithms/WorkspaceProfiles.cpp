// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "WorkspaceProfiles.h"
#include "arrange/LayoutHelpers.h"
#include "core/constants.h"
#include "core/geometryutils.h"
#include "core/logging.h"
#include <algorithm>
#include <utility>

namespace PlasmaArrange {

using namespace LayoutConstants;

namespace {

ProfileSlot slot(const char *role, qreal fraction)
{
    return ProfileSlot{QLatin1String(role), fraction};
}

constexpr SingleWindowPlacement FillArea{SingleWindowRule::Fill, 1.0, 0.0};
constexpr SingleWindowPlacement Video{SingleWindowRule::CenteredVideo, 1.0, 0.0};

constexpr SingleWindowPlacement centeredColumn(qreal widthFraction, qreal maxWidth)
{
    return SingleWindowPlacement{SingleWindowRule::Centered, widthFraction, maxWidth};
}

WorkspaceProfile columns(LayoutMode mode, SingleWindowPlacement single, QVector<ProfileSlot> slots)
{
    return WorkspaceProfile{mode, SplitAxis::Columns, std::move(slots), {}, single};
}

WorkspaceProfile rows(LayoutMode mode, SingleWindowPlacement single, QVector<ProfileSlot> slots)
{
    return WorkspaceProfile{mode, SplitAxis::Rows, std::move(slots), {}, single};
}

QVector<WorkspaceProfile> buildTable()
{
    QVector<WorkspaceProfile> table;

    // Document in the middle at a reading width, references left, notes right
    WorkspaceProfile reading = columns(LayoutMode::Reading, centeredColumn(0.5, 800.0),
                                       {slot("reference", 0.25), slot("document", 0.5), slot("notes", 0.25)});
    reading.fillOrder = {1, 0, 2};
    table.append(reading);

    table.append(columns(LayoutMode::Coding, FillArea, {slot("editor", 0.6), slot("terminal", 0.4)}));
    table.append(columns(LayoutMode::Design, FillArea, {slot("canvas", 0.7), slot("tools", 0.3)}));
    table.append(rows(LayoutMode::Communication, Video, {slot("video", 0.7), slot("chat", 0.3)}));
    table.append(rows(LayoutMode::Presentation, FillArea, {slot("slides", 0.75), slot("notes", 0.25)}));
    table.append(columns(LayoutMode::VideoConference, Video, {slot("call", 0.7), slot("notes", 0.3)}));
    table.append(columns(LayoutMode::DataAnalysis, FillArea,
                         {slot("notebook", 0.5), slot("dataset", 0.25), slot("charts", 0.25)}));
    table.append(columns(LayoutMode::ContentCreation, FillArea, {slot("editor", 0.65), slot("assets", 0.35)}));
    table.append(columns(LayoutMode::Trading, FillArea,
                         {slot("chart", 0.4), slot("orders", 0.2), slot("watchlist", 0.2), slot("news", 0.2)}));
    table.append(columns(LayoutMode::GamingStreaming, FillArea, {slot("game", 0.75), slot("chat", 0.25)}));
    table.append(columns(LayoutMode::Learning, centeredColumn(0.7, 1400.0),
                         {slot("lesson", 0.6), slot("notes", 0.4)}));
    table.append(columns(LayoutMode::ProjectManagement, FillArea,
                         {slot("board", 0.4), slot("documents", 0.3), slot("chat", 0.3)}));
    table.append(columns(LayoutMode::Monitoring, FillArea,
                         {slot("dashboard", 0.25), slot("dashboard", 0.25), slot("dashboard", 0.25),
                          slot("dashboard", 0.25)}));
    table.append(columns(LayoutMode::FullStackDev, FillArea,
                         {slot("editor", 0.45), slot("browser", 0.3), slot("terminal", 0.25)}));
    table.append(columns(LayoutMode::MobileDev, FillArea,
                         {slot("ide", 0.5), slot("simulator", 0.2), slot("logs", 0.3)}));
    table.append(rows(LayoutMode::DevOps, FillArea,
                      {slot("terminal", 0.5), slot("dashboard", 0.3), slot("logs", 0.2)}));
    table.append(columns(LayoutMode::MlAiDev, FillArea,
                         {slot("notebook", 0.5), slot("training", 0.3), slot("terminal", 0.2)}));
    table.append(rows(LayoutMode::GameDev, FillArea, {slot("viewport", 0.7), slot("code", 0.3)}));
    table.append(columns(LayoutMode::FrontendDev, FillArea,
                         {slot("editor", 0.5), slot("preview", 0.3), slot("console", 0.2)}));
    table.append(columns(LayoutMode::BackendApi, FillArea,
                         {slot("editor", 0.5), slot("api-client", 0.25), slot("terminal", 0.25)}));
    table.append(columns(LayoutMode::DesktopAppDev, FillArea,
                         {slot("ide", 0.55), slot("application", 0.3), slot("debugger", 0.15)}));

    return table;
}

const QVector<WorkspaceProfile> &profileTable()
{
    static const QVector<WorkspaceProfile> table = buildTable();
    return table;
}

QRectF singleWindowRect(const WorkspaceProfile &profile, const QRectF &area)
{
    const SingleWindowPlacement &single = profile.singleWindow;
    switch (single.rule) {
    case SingleWindowRule::Fill:
        break;
    case SingleWindowRule::Centered: {
        qreal width = area.width() * single.widthFraction;
        if (single.maxWidth > 0.0) {
            width = std::min(width, single.maxWidth);
        }
        return GeometryUtils::centered(QSizeF(width, area.height()), area);
    }
    case SingleWindowRule::CenteredVideo: {
        const qreal width = std::min(area.width() * VideoMaxWidthFraction, area.height() * VideoAspectRatio);
        return GeometryUtils::centered(QSizeF(width, width / VideoAspectRatio), area);
    }
    }
    return area;
}

} // namespace

int WorkspaceProfile::slotForWindow(int index) const
{
    if (fillOrder.size() == slots.size() && index >= 0 && index < fillOrder.size()) {
        return fillOrder[index];
    }
    return index;
}

QVector<LayoutMode> WorkspaceProfiles::profileModes()
{
    QVector<LayoutMode> modes;
    for (const WorkspaceProfile &p : profileTable()) {
        modes.append(p.mode);
    }
    return modes;
}

const WorkspaceProfile *WorkspaceProfiles::profile(LayoutMode mode)
{
    for (const WorkspaceProfile &p : profileTable()) {
        if (p.mode == mode) {
            return &p;
        }
    }
    return nullptr;
}

LayoutResult WorkspaceProfiles::arrange(const WorkspaceProfile &profile, int windowCount, const QRectF &area)
{
    LayoutResult rects;
    const int slotCount = profile.slots.size();
    if (windowCount <= 0 || slotCount == 0) {
        return rects;
    }

    if (windowCount == 1) {
        rects.append(singleWindowRect(profile, area));
        return rects;
    }

    // Slots in use, kept in screen order so the split reads left to right
    const int used = std::min(windowCount, slotCount);
    QVector<int> usedSlots;
    usedSlots.reserve(used);
    for (int i = 0; i < used; ++i) {
        usedSlots.append(profile.slotForWindow(i));
    }
    std::sort(usedSlots.begin(), usedSlots.end());

    QVector<qreal> fractions;
    fractions.reserve(used);
    for (int slotIndex : usedSlots) {
        fractions.append(profile.slots[slotIndex].fraction);
    }

    const QVector<QRectF> regions = profile.axis == SplitAxis::Columns
        ? LayoutHelpers::splitColumnsByFractions(area, fractions)
        : LayoutHelpers::splitRowsByFractions(area, fractions);

    auto regionForSlot = [&](int slotIndex) {
        return regions[static_cast<int>(std::find(usedSlots.cbegin(), usedSlots.cend(), slotIndex) - usedSlots.cbegin())];
    };

    rects.reserve(windowCount);
    const int dedicated = windowCount > slotCount ? slotCount - 1 : windowCount;
    for (int i = 0; i < dedicated; ++i) {
        rects.append(regionForSlot(profile.slotForWindow(i)));
    }

    if (windowCount > slotCount) {
        // Overflow windows share the last slot in fill order across its cross-axis
        const QRectF shared = regionForSlot(profile.slotForWindow(slotCount - 1));
        const int sharing = windowCount - slotCount + 1;
        rects.append(profile.axis == SplitAxis::Columns ? LayoutHelpers::splitRows(shared, sharing)
                                                        : LayoutHelpers::splitColumns(shared, sharing));
    }

    return rects;
}

LayoutResult WorkspaceProfiles::calculate(LayoutMode mode, int windowCount, const QRectF &area)
{
    const WorkspaceProfile *p = profile(mode);
    if (!p) {
        qCWarning(lcLayout) << "WorkspaceProfiles::calculate: no profile for mode" << static_cast<int>(mode);
        return {};
    }
    return arrange(*p, windowCount, area);
}

} // namespace PlasmaArrange
