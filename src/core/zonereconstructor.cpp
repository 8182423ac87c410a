// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "zonereconstructor.h"
#include "logging.h"
#include <QHash>

namespace Zoned {

namespace ZoneReconstructor {

ZoneConversionResult reconstruct(const EdgeLayout& edgeLayout)
{
    ZoneConversionResult result;
    ZoneLayout& layout = result.layout;
    layout.id = edgeLayout.id;
    layout.name = edgeLayout.name;

    QHash<QString, const Edge*> edgeMap;
    edgeMap.reserve(edgeLayout.edges.size());
    for (const Edge& edge : edgeLayout.edges) {
        edgeMap.insert(edge.id, &edge);
    }

    for (int index = 0; index < edgeLayout.regions.size(); ++index) {
        const Region& region = edgeLayout.regions.at(index);
        const Edge* left = edgeMap.value(region.left, nullptr);
        const Edge* right = edgeMap.value(region.right, nullptr);
        const Edge* top = edgeMap.value(region.top, nullptr);
        const Edge* bottom = edgeMap.value(region.bottom, nullptr);

        if (!left || !right || !top || !bottom) {
            const QString message = QStringLiteral("Region %1 has invalid edge references (left=%2, right=%3, top=%4, bottom=%5)")
                                        .arg(index)
                                        .arg(region.left, region.right, region.top, region.bottom);
            qCWarning(lcConverter).noquote() << message;
            result.diagnostics.append(message);
            result.droppedRegionIndices.append(index);
            continue;
        }

        Zone zone;
        zone.name = region.name.isEmpty() ? defaultZoneName(index) : region.name;
        zone.x = left->position;
        zone.y = top->position;
        zone.w = right->position - left->position;
        zone.h = bottom->position - top->position;
        layout.zones.append(zone);
    }

    qCDebug(lcConverter) << "Converted" << edgeLayout.regions.size() << "regions to" << layout.zones.size() << "zones";

    return result;
}

} // namespace ZoneReconstructor

} // namespace Zoned
