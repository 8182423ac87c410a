// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QtGlobal>

namespace Zoned {

/**
 * @brief Constants shared by the zone/edge layout converter
 *
 * All values are in normalized screen coordinates (0.0-1.0).
 */
namespace ConverterConstants {
// Positions within this distance are treated as the same boundary line.
// Callers generating near-boundary coordinates must stay within it.
constexpr qreal Tolerance = 0.001;

// Fragment grouping key resolution (4 decimal places)
constexpr qreal PositionScale = 10000.0;

// Screen boundary positions
constexpr qreal MinPosition = 0.0;
constexpr qreal MaxPosition = 1.0;

// Prefixes for synthesized edge ids (v0, v1, ... / h0, h1, ...)
inline constexpr QLatin1String VerticalIdPrefix{"v"};
inline constexpr QLatin1String HorizontalIdPrefix{"h"};
}

/**
 * @brief Ids of the four fixed screen-boundary edges
 */
namespace BoundaryEdgeId {
inline constexpr QLatin1String Left{"left"};
inline constexpr QLatin1String Right{"right"};
inline constexpr QLatin1String Top{"top"};
inline constexpr QLatin1String Bottom{"bottom"};
}

/**
 * @brief JSON keys for serialization
 */
namespace JsonKeys {
// Layout keys
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Name{"name"};
inline constexpr QLatin1String Zones{"zones"};
inline constexpr QLatin1String Edges{"edges"};
inline constexpr QLatin1String Regions{"regions"};

// Zone keys
inline constexpr QLatin1String X{"x"};
inline constexpr QLatin1String Y{"y"};
inline constexpr QLatin1String W{"w"};
inline constexpr QLatin1String H{"h"};

// Edge keys
inline constexpr QLatin1String Type{"type"};
inline constexpr QLatin1String Position{"position"};
inline constexpr QLatin1String Start{"start"};
inline constexpr QLatin1String Length{"length"};
inline constexpr QLatin1String Fixed{"fixed"};

// Region keys
inline constexpr QLatin1String Left{"left"};
inline constexpr QLatin1String Right{"right"};
inline constexpr QLatin1String Top{"top"};
inline constexpr QLatin1String Bottom{"bottom"};

// Edge type values
inline constexpr QLatin1String Vertical{"vertical"};
inline constexpr QLatin1String Horizontal{"horizontal"};
}

/**
 * @brief Template id conventions
 */
namespace TemplateIds {
// Layouts created from a template get "template-<templateId>" as a stable id
inline constexpr QLatin1String LayoutIdPrefix{"template-"};
}

} // namespace Zoned
