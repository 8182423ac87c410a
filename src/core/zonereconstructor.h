// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layouttypes.h"
#include "zoned_export.h"

namespace Zoned {

/**
 * @brief Recovers rectangles from an edge layout
 *
 * Structural inverse of EdgeGraphBuilder's region resolution. All ambiguity
 * was settled when the edges were created, so no tolerance search or
 * merging happens here.
 */
namespace ZoneReconstructor {

/**
 * @brief Convert an edge layout to a zone layout
 * @param edgeLayout Source layout, expected to pass LayoutValidator first
 * @return Zone layout plus the indices of regions with dangling edge ids
 *
 * Geometric consistency (left < right, top < bottom) is assumed, not checked.
 */
ZONED_EXPORT ZoneConversionResult reconstruct(const EdgeLayout& edgeLayout);

} // namespace ZoneReconstructor

} // namespace Zoned
