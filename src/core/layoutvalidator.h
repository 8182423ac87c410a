// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layouttypes.h"
#include "zoned_export.h"
#include <QJsonObject>

namespace Zoned {

/**
 * @brief Structural checks for layouts coming from outside the converter
 *
 * Each check logs a warning on failure and returns false at the first
 * problem found. Geometry (left < right, overlaps) is not checked.
 */
namespace LayoutValidator {

/**
 * @brief Validate an edge layout before reconstruction
 * @return true if all boundary edges exist, every edge position lies in
 *         [0,1] and every region references existing edges
 *
 * Checks run in that order and stop at the first failure.
 */
ZONED_EXPORT bool validateEdgeLayout(const EdgeLayout& edgeLayout);

/**
 * @brief Validate an edge layout in its JSON form
 *
 * Additionally requires the "edges" and "regions" arrays to be present
 * and every edge position to be a JSON number. Run this before
 * LayoutSerialization::edgeLayoutFromJson() on persisted or external data.
 */
ZONED_EXPORT bool validateEdgeLayoutJson(const QJsonObject& json);

/**
 * @brief Validate a stored zone layout
 * @return true if id and name are set, there is at least one zone and all
 *         zone coordinates are finite values in [0,1]
 */
ZONED_EXPORT bool validateZoneLayout(const ZoneLayout& zoneLayout);

} // namespace LayoutValidator

} // namespace Zoned
