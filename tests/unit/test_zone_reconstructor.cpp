// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QString>
#include <QVector>

#include "core/constants.h"
#include "core/edgegraphbuilder.h"
#include "core/templatecatalog.h"
#include "core/zonereconstructor.h"

using namespace Zoned;

/**
 * @brief Unit tests for ZoneReconstructor::reconstruct()
 *
 * Tests cover:
 * - Rectangles taken directly from referenced edge positions
 * - Round trip of every built-in template through the edge format
 * - Regions with dangling edge ids are dropped and reported
 * - Default names for unnamed regions
 */
class TestZoneReconstructor : public QObject
{
    Q_OBJECT

private:
    static EdgeLayout splitEdgeLayout(qreal dividerPosition)
    {
        EdgeLayout layout;
        layout.id = QStringLiteral("edited");
        layout.name = QStringLiteral("Edited Split");
        layout.edges = EdgeGraphBuilder::boundaryEdges();
        layout.edges.append(Edge{QStringLiteral("v0"), EdgeType::Vertical, dividerPosition, 0.0, 1.0, false});
        layout.regions = {
            Region{QStringLiteral("Left"), QStringLiteral("left"), QStringLiteral("v0"), QStringLiteral("top"),
                   QStringLiteral("bottom")},
            Region{QStringLiteral("Right"), QStringLiteral("v0"), QStringLiteral("right"), QStringLiteral("top"),
                   QStringLiteral("bottom")},
        };
        return layout;
    }

    static bool nearlyEqual(qreal a, qreal b)
    {
        return qAbs(a - b) < ConverterConstants::Tolerance;
    }

private Q_SLOTS:

    void test_emptyLayout_noZones()
    {
        EdgeLayout layout;
        layout.id = QStringLiteral("empty");
        layout.name = QStringLiteral("Empty");
        layout.edges = EdgeGraphBuilder::boundaryEdges();

        const ZoneConversionResult result = ZoneReconstructor::reconstruct(layout);

        QCOMPARE(result.layout.id, QStringLiteral("empty"));
        QCOMPARE(result.layout.name, QStringLiteral("Empty"));
        QVERIFY(result.layout.zones.isEmpty());
        QVERIFY(result.isComplete());
    }

    void test_movedEdge_resizesBothZones()
    {
        // Dragging the shared divider moves both neighbours
        const ZoneConversionResult result = ZoneReconstructor::reconstruct(splitEdgeLayout(0.3));

        QVERIFY(result.isComplete());
        QCOMPARE(result.layout.id, QStringLiteral("edited"));
        QCOMPARE(result.layout.zones.size(), 2);

        const Zone& left = result.layout.zones.at(0);
        QCOMPARE(left.name, QStringLiteral("Left"));
        QCOMPARE(left.x, 0.0);
        QCOMPARE(left.y, 0.0);
        QCOMPARE(left.w, 0.3);
        QCOMPARE(left.h, 1.0);

        const Zone& right = result.layout.zones.at(1);
        QCOMPARE(right.name, QStringLiteral("Right"));
        QCOMPARE(right.x, 0.3);
        QCOMPARE(right.w, 0.7);
        QCOMPARE(right.h, 1.0);
    }

    void test_templates_roundTrip_data()
    {
        QTest::addColumn<QString>("templateId");
        for (const LayoutTemplate& entry : TemplateCatalog::builtinTemplates()) {
            QTest::newRow(qPrintable(entry.id)) << entry.id;
        }
    }

    void test_templates_roundTrip()
    {
        QFETCH(QString, templateId);

        const std::optional<ZoneLayout> original = TemplateCatalog::createLayoutFromTemplate(templateId);
        QVERIFY(original);

        const EdgeConversionResult edges = EdgeGraphBuilder::build(*original);
        QVERIFY(edges.isComplete());

        const ZoneConversionResult zones = ZoneReconstructor::reconstruct(edges.layout);
        QVERIFY(zones.isComplete());
        QCOMPARE(zones.layout.id, original->id);
        QCOMPARE(zones.layout.name, original->name);
        QCOMPARE(zones.layout.zones.size(), original->zones.size());

        for (int i = 0; i < original->zones.size(); ++i) {
            const Zone& expected = original->zones.at(i);
            const Zone& actual = zones.layout.zones.at(i);
            QCOMPARE(actual.name, expected.name);
            QVERIFY2(nearlyEqual(actual.x, expected.x), qPrintable(expected.name));
            QVERIFY2(nearlyEqual(actual.y, expected.y), qPrintable(expected.name));
            QVERIFY2(nearlyEqual(actual.w, expected.w), qPrintable(expected.name));
            QVERIFY2(nearlyEqual(actual.h, expected.h), qPrintable(expected.name));
        }
    }

    void test_danglingReference_regionDropped()
    {
        EdgeLayout layout = splitEdgeLayout(0.5);
        layout.regions[1].right = QStringLiteral("v9");

        const ZoneConversionResult result = ZoneReconstructor::reconstruct(layout);

        QVERIFY(!result.isComplete());
        QCOMPARE(result.droppedRegionIndices, QVector<int>{1});
        QCOMPARE(result.diagnostics.size(), 1);
        QVERIFY(result.diagnostics.first().contains(QLatin1String("v9")));
        QCOMPARE(result.layout.zones.size(), 1);
        QCOMPARE(result.layout.zones.first().name, QStringLiteral("Left"));
    }

    void test_unnamedRegion_getsDefaultName()
    {
        EdgeLayout layout = splitEdgeLayout(0.5);
        layout.regions[1].name.clear();

        const ZoneConversionResult result = ZoneReconstructor::reconstruct(layout);

        QCOMPARE(result.layout.zones.size(), 2);
        QCOMPARE(result.layout.zones.at(0).name, QStringLiteral("Left"));
        QCOMPARE(result.layout.zones.at(1).name, QStringLiteral("Zone 2"));
    }
};

QTEST_MAIN(TestZoneReconstructor)
#include "test_zone_reconstructor.moc"
