// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "arrangeconfig.h"
#include "arrange/LayoutModeRegistry.h"
#include "core/logging.h"
#include <KConfigGroup>
#include <algorithm>

namespace PlasmaArrange {

using namespace ArrangeDefaults;
namespace Keys = ArrangeConfigKeys;

namespace {

int readValidatedInt(const KConfigGroup &group, const char *key, int defaultValue, int min, int max,
                     const char *settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

} // anonymous namespace

bool ArrangeConfig::operator==(const ArrangeConfig &other) const
{
    return defaultMode == other.defaultMode
        && gridPadding == other.gridPadding
        && dockClearance == other.dockClearance
        && minimumWindowSize == other.minimumWindowSize
        && overlapTolerance == other.overlapTolerance
        && snapThreshold == other.snapThreshold;
}

bool ArrangeConfig::operator!=(const ArrangeConfig &other) const
{
    return !(*this == other);
}

ArrangeConfig ArrangeConfig::validated() const
{
    ArrangeConfig config = *this;
    config.gridPadding = std::clamp(gridPadding, MinGridPadding, MaxGridPadding);
    config.dockClearance = std::clamp(dockClearance, MinDockClearance, MaxDockClearance);
    config.minimumWindowSize = QSize(std::clamp(minimumWindowSize.width(), MinimumWindowFloor, MaximumWindowFloor),
                                     std::clamp(minimumWindowSize.height(), MinimumWindowFloor, MaximumWindowFloor));
    config.overlapTolerance = std::clamp(overlapTolerance, MinOverlapTolerance, MaxOverlapTolerance);
    config.snapThreshold = std::clamp(snapThreshold, MinSnapThreshold, MaxSnapThreshold);
    if (!LayoutModeRegistry::modeFromId(defaultMode)) {
        config.defaultMode = LayoutModeRegistry::modeId(LayoutModeRegistry::defaultMode());
    }
    return config;
}

LayoutSettings ArrangeConfig::layoutSettings() const
{
    LayoutSettings settings;
    settings.padding = gridPadding;
    settings.dockClearance = dockClearance;
    settings.minimumSize = QSizeF(minimumWindowSize);
    settings.overlapTolerance = overlapTolerance;
    settings.snapThreshold = snapThreshold;
    return settings;
}

LayoutMode ArrangeConfig::layoutMode() const
{
    return LayoutModeRegistry::modeFromId(defaultMode).value_or(LayoutModeRegistry::defaultMode());
}

ArrangeConfig ArrangeConfig::fromConfigGroup(const KConfigGroup &group)
{
    ArrangeConfig config;

    const QString mode = group.readEntry(QLatin1String(Keys::DefaultMode), config.defaultMode);
    if (LayoutModeRegistry::modeFromId(mode)) {
        config.defaultMode = mode;
    } else {
        qCWarning(lcConfig) << "Unknown default mode" << mode << "using" << config.defaultMode;
    }

    config.gridPadding = readValidatedInt(group, Keys::GridPadding, ArrangeDefaults::GridPadding, MinGridPadding,
                                          MaxGridPadding, "grid padding");
    config.dockClearance = readValidatedInt(group, Keys::DockClearance, ArrangeDefaults::DockClearance, MinDockClearance,
                                            MaxDockClearance, "dock clearance");
    config.minimumWindowSize.setWidth(readValidatedInt(group, Keys::MinimumWindowWidth, ArrangeDefaults::MinimumWindowWidth,
                                                       MinimumWindowFloor, MaximumWindowFloor,
                                                       "minimum window width"));
    config.minimumWindowSize.setHeight(readValidatedInt(group, Keys::MinimumWindowHeight,
                                                        ArrangeDefaults::MinimumWindowHeight, MinimumWindowFloor,
                                                        MaximumWindowFloor, "minimum window height"));
    config.overlapTolerance = readValidatedInt(group, Keys::OverlapTolerance, ArrangeDefaults::OverlapTolerance,
                                               MinOverlapTolerance, MaxOverlapTolerance, "overlap tolerance");
    config.snapThreshold = readValidatedInt(group, Keys::SnapThreshold, ArrangeDefaults::SnapThreshold, MinSnapThreshold,
                                            MaxSnapThreshold, "snap threshold");

    qCDebug(lcConfig) << "Loaded arrange config: mode" << config.defaultMode << "padding" << config.gridPadding
                      << "minimum size" << config.minimumWindowSize;
    return config;
}

void ArrangeConfig::writeTo(KConfigGroup &group) const
{
    group.writeEntry(QLatin1String(Keys::DefaultMode), defaultMode);
    group.writeEntry(QLatin1String(Keys::GridPadding), gridPadding);
    group.writeEntry(QLatin1String(Keys::DockClearance), dockClearance);
    group.writeEntry(QLatin1String(Keys::MinimumWindowWidth), minimumWindowSize.width());
    group.writeEntry(QLatin1String(Keys::MinimumWindowHeight), minimumWindowSize.height());
    group.writeEntry(QLatin1String(Keys::OverlapTolerance), overlapTolerance);
    group.writeEntry(QLatin1String(Keys::SnapThreshold), snapThreshold);
}

} // namespace PlasmaArrange
