// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "zoned_export.h"
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace Zoned {

// ═══════════════════════════════════════════════════════════════════════════════
// Layout Representations
// ═══════════════════════════════════════════════════════════════════════════════
// ZoneLayout is the storage/runtime format: independent rectangles.
// EdgeLayout is the editing format: shared boundary lines plus regions that
// reference four of them, so moving one edge moves every adjoining zone.
// All geometry is normalized to the screen (0.0-1.0).
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Orientation of a boundary line
 *
 * Vertical: line at x = position, spanning y
 * Horizontal: line at y = position, spanning x
 */
enum class EdgeType {
    Vertical = 0,
    Horizontal = 1
};

ZONED_EXPORT QString edgeTypeToString(EdgeType type);
ZONED_EXPORT std::optional<EdgeType> edgeTypeFromString(const QString& value);

/**
 * @brief One rectangular tile of a zone layout
 */
struct ZONED_EXPORT Zone
{
    QString name;   ///< Display name, empty when unnamed
    qreal x = 0.0;  ///< Left position
    qreal y = 0.0;  ///< Top position
    qreal w = 0.0;  ///< Width
    qreal h = 0.0;  ///< Height

    qreal right() const { return x + w; }
    qreal bottom() const { return y + h; }
};

/**
 * @brief Zone-based layout (storage format)
 */
struct ZONED_EXPORT ZoneLayout
{
    QString id;
    QString name;
    QVector<Zone> zones;
};

/**
 * @brief Identified boundary line of an edge layout
 *
 * The four screen-boundary edges (left, right, top, bottom) are fixed and
 * always span the full [0,1] range. Interior edges are synthesized from
 * zone boundaries and are never fixed.
 */
struct ZONED_EXPORT Edge
{
    QString id;
    EdgeType type = EdgeType::Vertical;
    qreal position = 0.0;
    qreal start = 0.0;
    qreal length = 0.0;
    bool fixed = false;

    qreal end() const { return start + length; }
};

/**
 * @brief A zone expressed as four edge references
 */
struct ZONED_EXPORT Region
{
    QString name;
    QString left;
    QString right;
    QString top;
    QString bottom;

    /// Edge ids in left, right, top, bottom order
    QStringList edgeIds() const { return {left, right, top, bottom}; }
};

/**
 * @brief Edge-based layout (editor format)
 */
struct ZONED_EXPORT EdgeLayout
{
    QString id;
    QString name;
    QVector<Edge> edges;
    QVector<Region> regions;

    /**
     * @brief Look up an edge by id
     * @return Pointer into edges, or nullptr if no edge has that id
     */
    const Edge* findEdge(const QString& edgeId) const;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Conversion Results
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Result of converting a ZoneLayout into an EdgeLayout
 *
 * Zones whose sides could not be matched to an edge are left out of
 * layout.regions; their input indices are listed in droppedZoneIndices.
 */
struct ZONED_EXPORT EdgeConversionResult
{
    EdgeLayout layout;
    QVector<int> droppedZoneIndices;
    QStringList diagnostics; ///< One message per unresolved zone side

    bool isComplete() const { return droppedZoneIndices.isEmpty(); }
};

/**
 * @brief Result of converting an EdgeLayout back into a ZoneLayout
 */
struct ZONED_EXPORT ZoneConversionResult
{
    ZoneLayout layout;
    QVector<int> droppedRegionIndices;
    QStringList diagnostics;

    bool isComplete() const { return droppedRegionIndices.isEmpty(); }
};

/**
 * @brief Fallback name for an unnamed zone or region
 * @param index Zero-based index in the source collection
 * @return "Zone 1" for index 0, and so on
 */
ZONED_EXPORT QString defaultZoneName(int index);

} // namespace Zoned
