// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layoutconverter.h"
#include "edgegraphbuilder.h"
#include "layoutvalidator.h"
#include "zonereconstructor.h"

namespace Zoned {

namespace LayoutConverter {

EdgeLayout zonesToEdges(const ZoneLayout& zoneLayout)
{
    return EdgeGraphBuilder::build(zoneLayout).layout;
}

ZoneLayout edgesToZones(const EdgeLayout& edgeLayout)
{
    return ZoneReconstructor::reconstruct(edgeLayout).layout;
}

bool validateEdgeLayout(const EdgeLayout& edgeLayout)
{
    return LayoutValidator::validateEdgeLayout(edgeLayout);
}

} // namespace LayoutConverter

} // namespace Zoned
