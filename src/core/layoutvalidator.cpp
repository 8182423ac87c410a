// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layoutvalidator.h"
#include "constants.h"
#include "logging.h"
#include <QJsonArray>
#include <QSet>
#include <QtMath>

namespace Zoned {

namespace LayoutValidator {

namespace {

const QStringList& requiredBoundaryIds()
{
    static const QStringList ids{QString(BoundaryEdgeId::Left), QString(BoundaryEdgeId::Right),
                                 QString(BoundaryEdgeId::Top), QString(BoundaryEdgeId::Bottom)};
    return ids;
}

bool isNormalized(qreal value)
{
    return qIsFinite(value) && value >= ConverterConstants::MinPosition && value <= ConverterConstants::MaxPosition;
}

bool hasBoundaryEdges(const QSet<QString>& edgeIds)
{
    QStringList missing;
    for (const QString& id : requiredBoundaryIds()) {
        if (!edgeIds.contains(id)) {
            missing.append(id);
        }
    }

    if (!missing.isEmpty()) {
        qCWarning(lcValidator) << "Layout missing required boundary edges:" << missing.join(QStringLiteral(", "));
        return false;
    }
    return true;
}

bool hasValidRegionEdges(const QVector<Region>& regions, const QSet<QString>& edgeIds)
{
    for (int i = 0; i < regions.size(); ++i) {
        QStringList invalid;
        for (const QString& ref : regions.at(i).edgeIds()) {
            if (!edgeIds.contains(ref)) {
                invalid.append(ref);
            }
        }

        if (!invalid.isEmpty()) {
            qCWarning(lcValidator) << "Region" << i << "has invalid edge references:"
                                   << invalid.join(QStringLiteral(", "));
            return false;
        }
    }
    return true;
}

Region regionFromJson(const QJsonObject& json)
{
    Region region;
    region.name = json.value(JsonKeys::Name).toString();
    region.left = json.value(JsonKeys::Left).toString();
    region.right = json.value(JsonKeys::Right).toString();
    region.top = json.value(JsonKeys::Top).toString();
    region.bottom = json.value(JsonKeys::Bottom).toString();
    return region;
}

} // namespace

bool validateEdgeLayout(const EdgeLayout& edgeLayout)
{
    QSet<QString> edgeIds;
    edgeIds.reserve(edgeLayout.edges.size());
    for (const Edge& edge : edgeLayout.edges) {
        edgeIds.insert(edge.id);
    }

    if (!hasBoundaryEdges(edgeIds)) {
        return false;
    }

    for (const Edge& edge : edgeLayout.edges) {
        if (!isNormalized(edge.position)) {
            qCWarning(lcValidator) << "Edge" << edge.id << "has invalid position:" << edge.position;
            return false;
        }
    }

    if (!hasValidRegionEdges(edgeLayout.regions, edgeIds)) {
        return false;
    }

    qCDebug(lcValidator) << "Edge layout validation passed";
    return true;
}

bool validateEdgeLayoutJson(const QJsonObject& json)
{
    if (!json.value(JsonKeys::Edges).isArray() || !json.value(JsonKeys::Regions).isArray()) {
        qCWarning(lcValidator) << "Layout missing edges or regions";
        return false;
    }

    const QJsonArray edges = json.value(JsonKeys::Edges).toArray();
    const QJsonArray regions = json.value(JsonKeys::Regions).toArray();

    QSet<QString> edgeIds;
    edgeIds.reserve(edges.size());
    for (const QJsonValue& edge : edges) {
        edgeIds.insert(edge.toObject().value(JsonKeys::Id).toString());
    }

    if (!hasBoundaryEdges(edgeIds)) {
        return false;
    }

    for (const QJsonValue& value : edges) {
        const QJsonObject edge = value.toObject();
        const QJsonValue position = edge.value(JsonKeys::Position);
        if (!position.isDouble() || !isNormalized(position.toDouble())) {
            qCWarning(lcValidator) << "Edge" << edge.value(JsonKeys::Id).toString()
                                   << "has invalid position:" << position;
            return false;
        }
    }

    QVector<Region> parsedRegions;
    parsedRegions.reserve(regions.size());
    for (const QJsonValue& region : regions) {
        parsedRegions.append(regionFromJson(region.toObject()));
    }
    if (!hasValidRegionEdges(parsedRegions, edgeIds)) {
        return false;
    }

    qCDebug(lcValidator) << "Edge layout JSON validation passed";
    return true;
}

bool validateZoneLayout(const ZoneLayout& zoneLayout)
{
    if (zoneLayout.id.isEmpty()) {
        qCWarning(lcValidator) << "Layout missing valid id:" << zoneLayout.name;
        return false;
    }
    if (zoneLayout.name.isEmpty()) {
        qCWarning(lcValidator) << "Layout" << zoneLayout.id << "missing valid name";
        return false;
    }
    if (zoneLayout.zones.isEmpty()) {
        qCWarning(lcValidator) << "Layout" << zoneLayout.id << "missing valid zones array";
        return false;
    }

    for (int i = 0; i < zoneLayout.zones.size(); ++i) {
        const Zone& zone = zoneLayout.zones.at(i);
        if (!isNormalized(zone.x) || !isNormalized(zone.y) || !isNormalized(zone.w) || !isNormalized(zone.h)) {
            qCWarning(lcValidator) << "Layout" << zoneLayout.id << "zone" << i << "has out-of-range coordinates"
                                   << "- x:" << zone.x << "y:" << zone.y << "w:" << zone.w << "h:" << zone.h;
            return false;
        }
    }

    return true;
}

} // namespace LayoutValidator

} // namespace Zoned
