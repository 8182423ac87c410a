// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layouttypes.h"
#include "zoned_export.h"

namespace Zoned {

/**
 * @brief Builds an editable edge graph from a zone layout
 *
 * Every zone side that is not on the screen border becomes a boundary
 * fragment. Fragments at the same position that touch or overlap are merged
 * into one shared edge, so neighbouring zones end up referencing the same
 * edge id and move together when that edge is dragged. Fragments that align
 * but are separated by a gap larger than the tolerance stay separate edges.
 */
namespace EdgeGraphBuilder {

/**
 * @brief Convert a zone layout to an edge layout
 * @param zoneLayout Source layout, any number of zones
 * @return Edge layout plus the indices of zones that could not be resolved
 *
 * The result always contains the four fixed boundary edges. Zones with a
 * side that matches no edge are omitted from the regions and logged.
 * Overlapping zones are not supported; their edge grouping is unspecified.
 */
ZONED_EXPORT EdgeConversionResult build(const ZoneLayout& zoneLayout);

/**
 * @brief The four fixed screen-boundary edges (left, right, top, bottom)
 */
ZONED_EXPORT QVector<Edge> boundaryEdges();

} // namespace EdgeGraphBuilder

} // namespace Zoned
