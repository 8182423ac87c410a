// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layouttypes.h"
#include "constants.h"

namespace Zoned {

QString edgeTypeToString(EdgeType type)
{
    switch (type) {
    case EdgeType::Vertical:
        return QString(JsonKeys::Vertical);
    case EdgeType::Horizontal:
        return QString(JsonKeys::Horizontal);
    }
    return QString();
}

std::optional<EdgeType> edgeTypeFromString(const QString& value)
{
    if (value == JsonKeys::Vertical) {
        return EdgeType::Vertical;
    }
    if (value == JsonKeys::Horizontal) {
        return EdgeType::Horizontal;
    }
    return std::nullopt;
}

const Edge* EdgeLayout::findEdge(const QString& edgeId) const
{
    for (const Edge& edge : edges) {
        if (edge.id == edgeId) {
            return &edge;
        }
    }
    return nullptr;
}

QString defaultZoneName(int index)
{
    return QStringLiteral("Zone %1").arg(index + 1);
}

} // namespace Zoned
