// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "core/edgegraphbuilder.h"
#include "core/layoutserialization.h"
#include "core/templatecatalog.h"
#include "tool/layouttool.h"

using namespace Zoned;

/**
 * @brief Unit tests for the zoned-layout commands
 *
 * Commands read from and write to files in a temporary directory and are
 * checked by exit code and output.
 */
class TestLayoutTool : public QObject
{
    Q_OBJECT

private:
    QString path(const QString& fileName) const
    {
        return m_tempDir->filePath(fileName);
    }

    bool writeFile(const QString& fileName, const QByteArray& data) const
    {
        QFile file(path(fileName));
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return false;
        }
        return file.write(data) == data.size();
    }

    bool writeJsonFile(const QString& fileName, const QJsonObject& json) const
    {
        return writeFile(fileName, QJsonDocument(json).toJson());
    }

    QByteArray readFile(const QString& fileName) const
    {
        QFile file(path(fileName));
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    QJsonObject readJsonFile(const QString& fileName) const
    {
        return QJsonDocument::fromJson(readFile(fileName)).object();
    }

    LayoutTool::Options options() const
    {
        LayoutTool::Options opts;
        opts.outputPath = path(QStringLiteral("out.json"));
        return opts;
    }

    // One zone whose left side cannot be resolved, next to a valid one
    static QJsonObject partialZoneLayout()
    {
        ZoneLayout layout;
        layout.id = QStringLiteral("partial");
        layout.name = QStringLiteral("Partial");
        layout.zones = {
            Zone{QStringLiteral("Offset"), 0.001, 0.0, 0.499, 1.0},
            Zone{QStringLiteral("Right"), 0.5, 0.0, 0.5, 1.0},
        };
        return LayoutSerialization::zoneLayoutToJson(layout);
    }

    QTemporaryDir* m_tempDir = nullptr;

private Q_SLOTS:

    void init()
    {
        m_tempDir = new QTemporaryDir();
        QVERIFY(m_tempDir->isValid());
    }

    void cleanup()
    {
        delete m_tempDir;
        m_tempDir = nullptr;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // to-edges
    // ═══════════════════════════════════════════════════════════════════════════

    void test_toEdges_writesEdgeLayout()
    {
        const std::optional<ZoneLayout> zones = TemplateCatalog::createLayoutFromTemplate(QStringLiteral("quarters"));
        QVERIFY(zones);
        QVERIFY(writeJsonFile(QStringLiteral("zones.json"), LayoutSerialization::zoneLayoutToJson(*zones)));

        LayoutTool tool(options());
        QCOMPARE(tool.toEdges(path(QStringLiteral("zones.json"))), int(LayoutTool::Success));

        const QJsonObject json = readJsonFile(QStringLiteral("out.json"));
        QCOMPARE(json.value(QLatin1String("id")).toString(), QStringLiteral("template-quarters"));
        QCOMPARE(json.value(QLatin1String("edges")).toArray().size(), 6);
        QCOMPARE(json.value(QLatin1String("regions")).toArray().size(), 4);
    }

    void test_toEdges_compactOutput()
    {
        const std::optional<ZoneLayout> zones = TemplateCatalog::createLayoutFromTemplate(QStringLiteral("split"));
        QVERIFY(zones);
        QVERIFY(writeJsonFile(QStringLiteral("zones.json"), LayoutSerialization::zoneLayoutToJson(*zones)));

        LayoutTool::Options opts = options();
        opts.indentedJson = false;
        LayoutTool tool(opts);
        QCOMPARE(tool.toEdges(path(QStringLiteral("zones.json"))), int(LayoutTool::Success));

        const QByteArray output = readFile(QStringLiteral("out.json"));
        QVERIFY(output.endsWith('\n'));
        QCOMPARE(output.count('\n'), 1);
    }

    void test_toEdges_missingInput()
    {
        LayoutTool tool(options());
        QCOMPARE(tool.toEdges(path(QStringLiteral("does-not-exist.json"))), int(LayoutTool::InputError));
        QVERIFY(!QFile::exists(path(QStringLiteral("out.json"))));
    }

    void test_toEdges_malformedJson()
    {
        QVERIFY(writeFile(QStringLiteral("broken.json"), QByteArrayLiteral("{\"zones\": [")));

        LayoutTool tool(options());
        QCOMPARE(tool.toEdges(path(QStringLiteral("broken.json"))), int(LayoutTool::InputError));
    }

    void test_toEdges_strictRejectsInvalidZoneLayout()
    {
        ZoneLayout layout;
        layout.id = QStringLiteral("no-name");
        layout.zones = {Zone{QStringLiteral("Main"), 0.0, 0.0, 1.0, 1.0}};
        QVERIFY(writeJsonFile(QStringLiteral("zones.json"), LayoutSerialization::zoneLayoutToJson(layout)));

        LayoutTool strictTool(options());
        QCOMPARE(strictTool.toEdges(path(QStringLiteral("zones.json"))), int(LayoutTool::Rejected));

        LayoutTool::Options lenient = options();
        lenient.strictValidation = false;
        LayoutTool lenientTool(lenient);
        QCOMPARE(lenientTool.toEdges(path(QStringLiteral("zones.json"))), int(LayoutTool::Success));
    }

    void test_toEdges_partialResult()
    {
        QVERIFY(writeJsonFile(QStringLiteral("zones.json"), partialZoneLayout()));

        // Accepted by default, dropped zone missing from the output
        LayoutTool tool(options());
        QCOMPARE(tool.toEdges(path(QStringLiteral("zones.json"))), int(LayoutTool::Success));
        QCOMPARE(readJsonFile(QStringLiteral("out.json")).value(QLatin1String("regions")).toArray().size(), 1);

        LayoutTool::Options rejecting = options();
        rejecting.rejectPartialResults = true;
        LayoutTool rejectingTool(rejecting);
        QCOMPARE(rejectingTool.toEdges(path(QStringLiteral("zones.json"))), int(LayoutTool::Rejected));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // to-zones
    // ═══════════════════════════════════════════════════════════════════════════

    void test_toZones_writesZoneLayout()
    {
        const std::optional<ZoneLayout> zones = TemplateCatalog::createLayoutFromTemplate(QStringLiteral("wide"));
        QVERIFY(zones);
        const EdgeLayout edges = EdgeGraphBuilder::build(*zones).layout;
        QVERIFY(writeJsonFile(QStringLiteral("edges.json"), LayoutSerialization::edgeLayoutToJson(edges)));

        LayoutTool tool(options());
        QCOMPARE(tool.toZones(path(QStringLiteral("edges.json"))), int(LayoutTool::Success));

        const std::optional<ZoneLayout> result =
            LayoutSerialization::zoneLayoutFromJson(readJsonFile(QStringLiteral("out.json")));
        QVERIFY(result);
        QCOMPARE(result->id, QStringLiteral("template-wide"));
        QCOMPARE(result->zones.size(), 3);
        QCOMPARE(result->zones.at(1).name, QStringLiteral("Center"));
        QCOMPARE(result->zones.at(1).x, 0.25);
        QCOMPARE(result->zones.at(1).w, 0.5);
    }

    void test_toZones_danglingReference()
    {
        const std::optional<ZoneLayout> zones = TemplateCatalog::createLayoutFromTemplate(QStringLiteral("split"));
        QVERIFY(zones);
        EdgeLayout edges = EdgeGraphBuilder::build(*zones).layout;
        edges.regions.last().right = QStringLiteral("v7");
        QVERIFY(writeJsonFile(QStringLiteral("edges.json"), LayoutSerialization::edgeLayoutToJson(edges)));

        // Strict validation rejects before reconstruction
        LayoutTool strictTool(options());
        QCOMPARE(strictTool.toZones(path(QStringLiteral("edges.json"))), int(LayoutTool::Rejected));

        // Without it the region is dropped
        LayoutTool::Options lenient = options();
        lenient.strictValidation = false;
        LayoutTool lenientTool(lenient);
        QCOMPARE(lenientTool.toZones(path(QStringLiteral("edges.json"))), int(LayoutTool::Success));
        QCOMPARE(readJsonFile(QStringLiteral("out.json")).value(QLatin1String("zones")).toArray().size(), 1);

        lenient.rejectPartialResults = true;
        LayoutTool rejectingTool(lenient);
        QCOMPARE(rejectingTool.toZones(path(QStringLiteral("edges.json"))), int(LayoutTool::Rejected));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // validate
    // ═══════════════════════════════════════════════════════════════════════════

    void test_validate_validLayout()
    {
        const std::optional<ZoneLayout> zones = TemplateCatalog::createLayoutFromTemplate(QStringLiteral("triple"));
        QVERIFY(zones);
        QVERIFY(writeJsonFile(QStringLiteral("edges.json"),
                              LayoutSerialization::edgeLayoutToJson(EdgeGraphBuilder::build(*zones).layout)));

        LayoutTool tool(options());
        QCOMPARE(tool.validate(path(QStringLiteral("edges.json"))), int(LayoutTool::Success));
        QCOMPARE(readFile(QStringLiteral("out.json")), QByteArrayLiteral("valid\n"));
    }

    void test_validate_invalidLayout()
    {
        EdgeLayout edges;
        edges.id = QStringLiteral("broken");
        edges.edges = EdgeGraphBuilder::boundaryEdges();
        edges.edges.removeLast();
        QVERIFY(writeJsonFile(QStringLiteral("edges.json"), LayoutSerialization::edgeLayoutToJson(edges)));

        LayoutTool tool(options());
        QCOMPARE(tool.validate(path(QStringLiteral("edges.json"))), int(LayoutTool::Invalid));
        QCOMPARE(readFile(QStringLiteral("out.json")), QByteArrayLiteral("invalid\n"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // templates / template
    // ═══════════════════════════════════════════════════════════════════════════

    void test_listTemplates()
    {
        LayoutTool tool(options());
        QCOMPARE(tool.listTemplates(), int(LayoutTool::Success));

        const QList<QByteArray> lines = readFile(QStringLiteral("out.json")).trimmed().split('\n');
        QCOMPARE(lines.size(), TemplateCatalog::templateCount());
        QVERIFY(lines.first().startsWith("split\tSplit\t"));
        QCOMPARE(lines.last().split('\t').size(), 3);
    }

    void test_instantiateTemplate()
    {
        LayoutTool tool(options());
        QCOMPARE(tool.instantiateTemplate(QStringLiteral("triple_stack")), int(LayoutTool::Success));

        const QJsonObject json = readJsonFile(QStringLiteral("out.json"));
        QCOMPARE(json.value(QLatin1String("id")).toString(), QStringLiteral("template-triple_stack"));
        QCOMPARE(json.value(QLatin1String("zones")).toArray().size(), 4);

        QCOMPARE(tool.instantiateTemplate(QStringLiteral("unknown")), int(LayoutTool::Invalid));
    }
};

QTEST_MAIN(TestLayoutTool)
#include "test_layout_tool.moc"
