// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layouttool.h"
#include "../config/convertersettings.h"
#include "../core/constants.h"
#include "../core/edgegraphbuilder.h"
#include "../core/layoutserialization.h"
#include "../core/layoutvalidator.h"
#include "../core/logging.h"
#include "../core/templatecatalog.h"
#include "../core/zonereconstructor.h"

#include <QFile>
#include <QJsonDocument>

namespace Zoned {

namespace {

bool isStdio(const QString& path)
{
    return path.isEmpty() || path == QLatin1String("-");
}

} // namespace

LayoutTool::Options LayoutTool::Options::fromSettings(const ConverterSettings& settings)
{
    Options options;
    options.indentedJson = settings.indentedJson();
    options.strictValidation = settings.strictValidation();
    options.rejectPartialResults = settings.rejectPartialResults();
    return options;
}

LayoutTool::LayoutTool(const Options& options)
    : m_options(options)
{
}

int LayoutTool::toEdges(const QString& inputPath)
{
    const std::optional<QJsonObject> json = readInput(inputPath);
    if (!json) {
        return InputError;
    }

    const std::optional<ZoneLayout> zoneLayout = LayoutSerialization::zoneLayoutFromJson(*json);
    if (!zoneLayout) {
        return InputError;
    }

    if (m_options.strictValidation && !LayoutValidator::validateZoneLayout(*zoneLayout)) {
        qCWarning(lcTool) << "Zone layout" << zoneLayout->id << "failed validation";
        return Rejected;
    }

    const EdgeConversionResult result = EdgeGraphBuilder::build(*zoneLayout);
    if (!result.isComplete()) {
        qCWarning(lcTool) << "Dropped zones" << result.droppedZoneIndices << "of layout" << zoneLayout->id;
        if (m_options.rejectPartialResults) {
            return Rejected;
        }
    }

    return writeJson(LayoutSerialization::edgeLayoutToJson(result.layout)) ? Success : InputError;
}

int LayoutTool::toZones(const QString& inputPath)
{
    const std::optional<QJsonObject> json = readInput(inputPath);
    if (!json) {
        return InputError;
    }

    if (m_options.strictValidation && !LayoutValidator::validateEdgeLayoutJson(*json)) {
        qCWarning(lcTool) << "Edge layout" << json->value(JsonKeys::Id).toString() << "failed validation";
        return Rejected;
    }

    const std::optional<EdgeLayout> edgeLayout = LayoutSerialization::edgeLayoutFromJson(*json);
    if (!edgeLayout) {
        return InputError;
    }

    const ZoneConversionResult result = ZoneReconstructor::reconstruct(*edgeLayout);
    if (!result.isComplete()) {
        qCWarning(lcTool) << "Dropped regions" << result.droppedRegionIndices << "of layout" << edgeLayout->id;
        if (m_options.rejectPartialResults) {
            return Rejected;
        }
    }

    return writeJson(LayoutSerialization::zoneLayoutToJson(result.layout)) ? Success : InputError;
}

int LayoutTool::validate(const QString& inputPath)
{
    const std::optional<QJsonObject> json = readInput(inputPath);
    if (!json) {
        return InputError;
    }

    const bool valid = LayoutValidator::validateEdgeLayoutJson(*json);
    if (!writeOutput(valid ? QByteArrayLiteral("valid\n") : QByteArrayLiteral("invalid\n"))) {
        return InputError;
    }
    return valid ? Success : Invalid;
}

int LayoutTool::listTemplates()
{
    QByteArray data;
    for (const LayoutTemplate& entry : TemplateCatalog::builtinTemplates()) {
        data += entry.id.toUtf8() + '\t' + entry.name.toUtf8() + '\t' + entry.description.toUtf8() + '\n';
    }
    return writeOutput(data) ? Success : InputError;
}

int LayoutTool::instantiateTemplate(const QString& templateId)
{
    const std::optional<ZoneLayout> layout = TemplateCatalog::createLayoutFromTemplate(templateId);
    if (!layout) {
        return Invalid;
    }
    return writeJson(LayoutSerialization::zoneLayoutToJson(*layout)) ? Success : InputError;
}

std::optional<QJsonObject> LayoutTool::readInput(const QString& inputPath) const
{
    QFile file;
    bool opened = false;
    if (isStdio(inputPath)) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(inputPath);
        opened = file.open(QIODevice::ReadOnly);
    }

    if (!opened) {
        qCWarning(lcTool) << "Cannot open input" << inputPath << ":" << file.errorString();
        return std::nullopt;
    }

    const QString source = isStdio(inputPath) ? QStringLiteral("stdin") : inputPath;
    return LayoutSerialization::parseJsonObject(file.readAll(), source);
}

bool LayoutTool::writeOutput(const QByteArray& data) const
{
    QFile file;
    bool opened = false;
    if (isStdio(m_options.outputPath)) {
        opened = file.open(stdout, QIODevice::WriteOnly);
    } else {
        file.setFileName(m_options.outputPath);
        opened = file.open(QIODevice::WriteOnly | QIODevice::Truncate);
    }

    if (!opened) {
        qCWarning(lcTool) << "Cannot open output" << m_options.outputPath << ":" << file.errorString();
        return false;
    }

    if (file.write(data) != data.size()) {
        qCWarning(lcTool) << "Failed to write output" << m_options.outputPath << ":" << file.errorString();
        return false;
    }

    if (!isStdio(m_options.outputPath)) {
        qCInfo(lcTool) << "Wrote" << data.size() << "bytes to" << m_options.outputPath;
    }
    return true;
}

bool LayoutTool::writeJson(const QJsonObject& json) const
{
    const QJsonDocument::JsonFormat format = m_options.indentedJson ? QJsonDocument::Indented : QJsonDocument::Compact;
    QByteArray data = QJsonDocument(json).toJson(format);
    if (!data.endsWith('\n')) {
        data += '\n';
    }
    return writeOutput(data);
}

} // namespace Zoned
