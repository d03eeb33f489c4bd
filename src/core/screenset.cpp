// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenset.h"
#include "geometryutils.h"
#include "logging.h"

namespace PlasmaArrange {

ScreenSet::ScreenSet(const QVector<Screen> &screens)
    : m_screens(screens)
{
}

const Screen *ScreenSet::screen(int index) const
{
    if (index < 0 || index >= m_screens.size()) {
        qCDebug(lcCore) << "ScreenSet::screen: index" << index << "out of range (" << m_screens.size() << "screens)";
        return nullptr;
    }
    return &m_screens[index];
}

const Screen *ScreenSet::screenAt(const QPointF &point) const
{
    for (const Screen &s : m_screens) {
        // Half-open test so a point on a shared edge belongs to one screen only
        const QRectF f = s.fullFrame;
        if (point.x() >= f.left() && point.x() < f.right() && point.y() >= f.top() && point.y() < f.bottom()) {
            return &s;
        }
    }
    return nullptr;
}

const Screen *ScreenSet::screenForWindow(const QRectF &frame) const
{
    if (m_screens.isEmpty()) {
        return nullptr;
    }

    const Screen *best = &m_screens.first();
    qreal bestArea = 0.0;
    for (const Screen &s : m_screens) {
        const qreal shared = GeometryUtils::overlapArea(s.fullFrame, frame);
        if (shared > bestArea) {
            bestArea = shared;
            best = &s;
        }
    }
    if (bestArea <= 0.0) {
        qCDebug(lcGeometry) << "Window" << frame << "is off every screen, using" << best->name;
    }
    return best;
}

} // namespace PlasmaArrange
