// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layouttypes.h"
#include "zoned_export.h"

namespace Zoned {

/**
 * @brief Conversion between zone-based and edge-based layouts
 *
 * The editor converts a stored ZoneLayout with zonesToEdges(), lets the user
 * drag shared edges, gates the result with validateEdgeLayout() and turns it
 * back into a ZoneLayout with edgesToZones().
 *
 * These functions return only the converted layout. Use
 * EdgeGraphBuilder::build() or ZoneReconstructor::reconstruct() to find out
 * which zones or regions were dropped.
 *
 * All functions are pure and re-entrant.
 */
namespace LayoutConverter {

ZONED_EXPORT EdgeLayout zonesToEdges(const ZoneLayout& zoneLayout);

ZONED_EXPORT ZoneLayout edgesToZones(const EdgeLayout& edgeLayout);

ZONED_EXPORT bool validateEdgeLayout(const EdgeLayout& edgeLayout);

} // namespace LayoutConverter

} // namespace Zoned
