// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layoutserialization.h"
#include "constants.h"
#include "logging.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace Zoned {

namespace LayoutSerialization {

namespace {

// Reads a required numeric member; a missing or non-numeric value fails
bool readNumber(const QJsonObject& json, QLatin1String key, qreal& out)
{
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return false;
    }
    out = value.toDouble();
    return true;
}

QJsonObject zoneToJson(const Zone& zone)
{
    using namespace JsonKeys;
    QJsonObject json;
    if (!zone.name.isEmpty()) {
        json[Name] = zone.name;
    }
    json[X] = zone.x;
    json[Y] = zone.y;
    json[W] = zone.w;
    json[H] = zone.h;
    return json;
}

std::optional<Zone> zoneFromJson(const QJsonObject& json)
{
    using namespace JsonKeys;
    Zone zone;
    zone.name = json.value(Name).toString();
    if (!readNumber(json, X, zone.x) || !readNumber(json, Y, zone.y) || !readNumber(json, W, zone.w)
        || !readNumber(json, H, zone.h)) {
        return std::nullopt;
    }
    return zone;
}

QJsonObject edgeToJson(const Edge& edge)
{
    using namespace JsonKeys;
    QJsonObject json;
    json[Id] = edge.id;
    json[Type] = edgeTypeToString(edge.type);
    json[Position] = edge.position;
    json[Start] = edge.start;
    json[Length] = edge.length;
    json[Fixed] = edge.fixed;
    return json;
}

std::optional<Edge> edgeFromJson(const QJsonObject& json)
{
    using namespace JsonKeys;
    const std::optional<EdgeType> type = edgeTypeFromString(json.value(Type).toString());
    if (!type) {
        return std::nullopt;
    }

    Edge edge;
    edge.id = json.value(Id).toString();
    edge.type = *type;
    edge.fixed = json.value(Fixed).toBool(false);
    if (!readNumber(json, Position, edge.position) || !readNumber(json, Start, edge.start)
        || !readNumber(json, Length, edge.length)) {
        return std::nullopt;
    }
    return edge;
}

QJsonObject regionToJson(const Region& region)
{
    using namespace JsonKeys;
    QJsonObject json;
    json[Name] = region.name;
    json[Left] = region.left;
    json[Right] = region.right;
    json[Top] = region.top;
    json[Bottom] = region.bottom;
    return json;
}

Region regionFromJson(const QJsonObject& json)
{
    using namespace JsonKeys;
    Region region;
    region.name = json.value(Name).toString();
    region.left = json.value(Left).toString();
    region.right = json.value(Right).toString();
    region.top = json.value(Top).toString();
    region.bottom = json.value(Bottom).toString();
    return region;
}

} // namespace

QJsonObject zoneLayoutToJson(const ZoneLayout& layout)
{
    QJsonArray zones;
    for (const Zone& zone : layout.zones) {
        zones.append(zoneToJson(zone));
    }

    QJsonObject json;
    json[JsonKeys::Id] = layout.id;
    json[JsonKeys::Name] = layout.name;
    json[JsonKeys::Zones] = zones;
    return json;
}

std::optional<ZoneLayout> zoneLayoutFromJson(const QJsonObject& json)
{
    if (!json.value(JsonKeys::Zones).isArray()) {
        qCWarning(lcSerialization) << "Zone layout" << json.value(JsonKeys::Id).toString() << "has no zones array";
        return std::nullopt;
    }

    ZoneLayout layout;
    layout.id = json.value(JsonKeys::Id).toString();
    layout.name = json.value(JsonKeys::Name).toString();

    const QJsonArray zones = json.value(JsonKeys::Zones).toArray();
    layout.zones.reserve(zones.size());
    for (int i = 0; i < zones.size(); ++i) {
        const std::optional<Zone> zone = zoneFromJson(zones.at(i).toObject());
        if (!zone) {
            qCWarning(lcSerialization) << "Zone layout" << layout.id << "zone" << i << "has invalid coordinates";
            return std::nullopt;
        }
        layout.zones.append(*zone);
    }

    return layout;
}

QJsonObject edgeLayoutToJson(const EdgeLayout& layout)
{
    QJsonArray edges;
    for (const Edge& edge : layout.edges) {
        edges.append(edgeToJson(edge));
    }

    QJsonArray regions;
    for (const Region& region : layout.regions) {
        regions.append(regionToJson(region));
    }

    QJsonObject json;
    json[JsonKeys::Id] = layout.id;
    json[JsonKeys::Name] = layout.name;
    json[JsonKeys::Edges] = edges;
    json[JsonKeys::Regions] = regions;
    return json;
}

std::optional<EdgeLayout> edgeLayoutFromJson(const QJsonObject& json)
{
    if (!json.value(JsonKeys::Edges).isArray() || !json.value(JsonKeys::Regions).isArray()) {
        qCWarning(lcSerialization) << "Edge layout" << json.value(JsonKeys::Id).toString()
                                   << "has no edges or regions array";
        return std::nullopt;
    }

    EdgeLayout layout;
    layout.id = json.value(JsonKeys::Id).toString();
    layout.name = json.value(JsonKeys::Name).toString();

    const QJsonArray edges = json.value(JsonKeys::Edges).toArray();
    layout.edges.reserve(edges.size());
    for (int i = 0; i < edges.size(); ++i) {
        const std::optional<Edge> edge = edgeFromJson(edges.at(i).toObject());
        if (!edge) {
            qCWarning(lcSerialization) << "Edge layout" << layout.id << "edge" << i
                                       << "has an unknown type or non-numeric coordinates";
            return std::nullopt;
        }
        layout.edges.append(*edge);
    }

    const QJsonArray regions = json.value(JsonKeys::Regions).toArray();
    layout.regions.reserve(regions.size());
    for (const QJsonValue& region : regions) {
        layout.regions.append(regionFromJson(region.toObject()));
    }

    return layout;
}

std::optional<QJsonObject> parseJsonObject(const QByteArray& data, const QString& source)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        qCWarning(lcSerialization) << "Failed to parse JSON from" << source << ":" << error.errorString()
                                   << "at offset" << error.offset;
        return std::nullopt;
    }
    if (!doc.isObject()) {
        qCWarning(lcSerialization) << "JSON from" << source << "is not an object";
        return std::nullopt;
    }
    return doc.object();
}

} // namespace LayoutSerialization

} // namespace Zoned
