// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layouttypes.h"
#include "zoned_export.h"
#include <QByteArray>
#include <QJsonObject>
#include <optional>

namespace Zoned {

/**
 * @brief JSON conversion for zone and edge layouts
 *
 * Zone layout:
 *   {"id", "name", "zones": [{"name"?, "x", "y", "w", "h"}]}
 *
 * Edge layout:
 *   {"id", "name",
 *    "edges": [{"id", "type": "vertical"|"horizontal", "position", "start", "length", "fixed"}],
 *    "regions": [{"name", "left", "right", "top", "bottom"}]}
 *
 * The fromJson functions only check shape. Run LayoutValidator on the result
 * (or LayoutValidator::validateEdgeLayoutJson() on the input) before use.
 */
namespace LayoutSerialization {

ZONED_EXPORT QJsonObject zoneLayoutToJson(const ZoneLayout& layout);

/**
 * @brief Parse a zone layout
 * @return Layout, or std::nullopt if "zones" is missing or a zone coordinate
 *         is not a number
 */
ZONED_EXPORT std::optional<ZoneLayout> zoneLayoutFromJson(const QJsonObject& json);

ZONED_EXPORT QJsonObject edgeLayoutToJson(const EdgeLayout& layout);

/**
 * @brief Parse an edge layout
 * @return Layout, or std::nullopt if "edges" or "regions" is missing, an
 *         edge type is unknown or an edge coordinate is not a number
 */
ZONED_EXPORT std::optional<EdgeLayout> edgeLayoutFromJson(const QJsonObject& json);

/**
 * @brief Parse raw bytes as a JSON object
 * @param data UTF-8 JSON text
 * @param source Description of where the data came from, for log messages
 * @return Object, or std::nullopt on parse errors or a non-object document
 */
ZONED_EXPORT std::optional<QJsonObject> parseJsonObject(const QByteArray& data, const QString& source);

} // namespace LayoutSerialization

} // namespace Zoned
