// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "edgegraphbuilder.h"
#include "constants.h"
#include "logging.h"
#include <QtMath>
#include <algorithm>
#include <map>
#include <optional>
#include <tuple>

namespace Zoned {

namespace EdgeGraphBuilder {

namespace {

using namespace ConverterConstants;

/**
 * @brief One zone side along its edge axis, before merging
 */
struct Fragment
{
    qreal start = 0.0;
    qreal end = 0.0;
};

/**
 * @brief Fragment group key: edge type plus position in units of 1/PositionScale
 */
struct GroupKey
{
    EdgeType type = EdgeType::Vertical;
    qint64 position = 0;

    bool operator<(const GroupKey& other) const
    {
        return std::tie(type, position) < std::tie(other.type, other.position);
    }
};

// Ordered so that ids are assigned vertical first, then by ascending position
using FragmentGroups = std::map<GroupKey, QVector<Fragment>>;

/**
 * @brief A zone side to resolve against the edge set
 */
struct SideQuery
{
    EdgeType type;
    qreal position;
    qreal rangeStart;
    qreal rangeEnd;
};

qint64 quantizePosition(qreal position)
{
    return qRound64(position * PositionScale);
}

void addFragment(FragmentGroups& groups, EdgeType type, qreal position, qreal start, qreal end)
{
    groups[GroupKey{type, quantizePosition(position)}].append(Fragment{start, end});
}

// Sides lying on the screen border produce no fragment; they resolve to the
// fixed boundary edges instead.
void collectFragments(const Zone& zone, FragmentGroups& groups)
{
    if (zone.x > MinPosition + Tolerance) {
        addFragment(groups, EdgeType::Vertical, zone.x, zone.y, zone.bottom());
    }
    if (zone.right() < MaxPosition - Tolerance) {
        addFragment(groups, EdgeType::Vertical, zone.right(), zone.y, zone.bottom());
    }
    if (zone.y > MinPosition + Tolerance) {
        addFragment(groups, EdgeType::Horizontal, zone.y, zone.x, zone.right());
    }
    if (zone.bottom() < MaxPosition - Tolerance) {
        addFragment(groups, EdgeType::Horizontal, zone.bottom(), zone.x, zone.right());
    }
}

/**
 * @brief Merge fragments that overlap or touch into maximal runs
 *
 * Fragments separated by more than the tolerance stay separate runs.
 */
QVector<Fragment> mergeFragments(QVector<Fragment> fragments)
{
    QVector<Fragment> merged;
    if (fragments.isEmpty()) {
        return merged;
    }

    std::sort(fragments.begin(), fragments.end(), [](const Fragment& a, const Fragment& b) {
        return a.start < b.start;
    });

    Fragment current = fragments.first();
    for (int i = 1; i < fragments.size(); ++i) {
        const Fragment& next = fragments.at(i);
        if (next.start <= current.end + Tolerance) {
            current.end = qMax(current.end, next.end);
        } else {
            merged.append(current);
            current = next;
        }
    }
    merged.append(current);

    return merged;
}

QString nextEdgeId(EdgeType type, int& verticalCounter, int& horizontalCounter)
{
    if (type == EdgeType::Vertical) {
        return QString(VerticalIdPrefix) + QString::number(verticalCounter++);
    }
    return QString(HorizontalIdPrefix) + QString::number(horizontalCounter++);
}

std::optional<QString> boundaryEdgeId(EdgeType type, qreal position)
{
    if (qAbs(position - MinPosition) < Tolerance) {
        return QString(type == EdgeType::Vertical ? BoundaryEdgeId::Left : BoundaryEdgeId::Top);
    }
    if (qAbs(position - MaxPosition) < Tolerance) {
        return QString(type == EdgeType::Vertical ? BoundaryEdgeId::Right : BoundaryEdgeId::Bottom);
    }
    return std::nullopt;
}

/**
 * @brief Find the edge a zone side lies on
 *
 * Screen-border sides map straight to the fixed ids. Otherwise the first
 * edge of the same type and position whose span contains the side wins.
 */
std::optional<QString> findEdgeId(const QVector<Edge>& edges, const SideQuery& side)
{
    if (auto boundaryId = boundaryEdgeId(side.type, side.position)) {
        return boundaryId;
    }

    for (const Edge& edge : edges) {
        if (edge.type != side.type || qAbs(edge.position - side.position) >= Tolerance) {
            continue;
        }
        if (edge.start <= side.rangeStart + Tolerance && edge.end() >= side.rangeEnd - Tolerance) {
            return edge.id;
        }
    }

    return std::nullopt;
}

} // namespace

QVector<Edge> boundaryEdges()
{
    return {
        Edge{QString(BoundaryEdgeId::Left), EdgeType::Vertical, MinPosition, MinPosition, MaxPosition, true},
        Edge{QString(BoundaryEdgeId::Right), EdgeType::Vertical, MaxPosition, MinPosition, MaxPosition, true},
        Edge{QString(BoundaryEdgeId::Top), EdgeType::Horizontal, MinPosition, MinPosition, MaxPosition, true},
        Edge{QString(BoundaryEdgeId::Bottom), EdgeType::Horizontal, MaxPosition, MinPosition, MaxPosition, true},
    };
}

EdgeConversionResult build(const ZoneLayout& zoneLayout)
{
    EdgeConversionResult result;
    EdgeLayout& layout = result.layout;
    layout.id = zoneLayout.id;
    layout.name = zoneLayout.name;
    layout.edges = boundaryEdges();

    FragmentGroups groups;
    for (const Zone& zone : zoneLayout.zones) {
        collectFragments(zone, groups);
    }

    int verticalCounter = 0;
    int horizontalCounter = 0;
    for (const auto& [key, fragments] : groups) {
        const qreal position = key.position / PositionScale;
        const QVector<Fragment> runs = mergeFragments(fragments);
        for (const Fragment& run : runs) {
            Edge edge;
            edge.id = nextEdgeId(key.type, verticalCounter, horizontalCounter);
            edge.type = key.type;
            edge.position = position;
            edge.start = run.start;
            edge.length = run.end - run.start;
            edge.fixed = false;
            layout.edges.append(edge);
        }
    }

    for (int index = 0; index < zoneLayout.zones.size(); ++index) {
        const Zone& zone = zoneLayout.zones.at(index);

        // left, right, top, bottom
        const SideQuery sides[] = {
            {EdgeType::Vertical, zone.x, zone.y, zone.bottom()},
            {EdgeType::Vertical, zone.right(), zone.y, zone.bottom()},
            {EdgeType::Horizontal, zone.y, zone.x, zone.right()},
            {EdgeType::Horizontal, zone.bottom(), zone.x, zone.right()},
        };

        QStringList edgeIds;
        for (const SideQuery& side : sides) {
            const std::optional<QString> edgeId = findEdgeId(layout.edges, side);
            if (!edgeId) {
                const QString message = QStringLiteral("Could not find edge for zone %1: type=%2, position=%3, range=[%4, %5]")
                                            .arg(index)
                                            .arg(edgeTypeToString(side.type))
                                            .arg(side.position)
                                            .arg(side.rangeStart)
                                            .arg(side.rangeEnd);
                qCWarning(lcConverter).noquote() << message;
                result.diagnostics.append(message);
                continue;
            }
            edgeIds.append(*edgeId);
        }

        if (edgeIds.size() != 4) {
            qCWarning(lcConverter) << "Dropping zone" << index << "from layout" << zoneLayout.id
                                   << "- not every side resolves to an edge";
            result.droppedZoneIndices.append(index);
            continue;
        }

        Region region;
        region.name = zone.name.isEmpty() ? defaultZoneName(index) : zone.name;
        region.left = edgeIds.at(0);
        region.right = edgeIds.at(1);
        region.top = edgeIds.at(2);
        region.bottom = edgeIds.at(3);
        layout.regions.append(region);
    }

    qCDebug(lcConverter) << "Converted" << zoneLayout.zones.size() << "zones to" << layout.edges.size() << "edges and"
                         << layout.regions.size() << "regions";

    return result;
}

} // namespace EdgeGraphBuilder

} // namespace Zoned
