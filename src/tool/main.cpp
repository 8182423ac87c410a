// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#define TRANSLATION_DOMAIN "zoned-layout"

#include "layouttool.h"
#include "../config/convertersettings.h"
#include "../core/logging.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

using namespace Zoned;

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("zoned-layout");

    KAboutData aboutData(QStringLiteral("zoned-layout"), i18n("Zoned Layout Tool"),
                         QStringLiteral(ZONED_VERSION_STRING),
                         i18n("Convert Zoned layouts between zone and edge formats"), KAboutLicense::GPL_V3,
                         i18n("(c) 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    KAboutData::setApplicationData(aboutData);

    // Command line options
    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 i18n("One of: to-edges, to-zones, validate, templates, template"));
    parser.addPositionalArgument(QStringLiteral("input"),
                                 i18n("Input file (\"-\" or omitted for stdin), or a template id"),
                                 QStringLiteral("[input]"));

    QCommandLineOption outputOption(QStringList{QStringLiteral("o"), QStringLiteral("output")},
                                    i18n("Write the result to a file instead of stdout"), QStringLiteral("file"));
    QCommandLineOption compactOption(QStringLiteral("compact"), i18n("Write compact JSON"));
    QCommandLineOption strictOption(QStringLiteral("strict"), i18n("Validate layouts before converting them"));
    QCommandLineOption allowPartialOption(QStringLiteral("allow-partial"),
                                          i18n("Accept results with dropped zones or regions"));

    parser.addOptions({outputOption, compactOption, strictOption, allowPartialOption});
    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || args.size() > 2) {
        QTextStream(stderr) << parser.helpText();
        return LayoutTool::UsageError;
    }

    ConverterSettings settings;
    settings.load();

    LayoutTool::Options options = LayoutTool::Options::fromSettings(settings);
    if (parser.isSet(outputOption)) {
        options.outputPath = parser.value(outputOption);
    }
    if (parser.isSet(compactOption)) {
        options.indentedJson = false;
    }
    if (parser.isSet(strictOption)) {
        options.strictValidation = true;
    }
    if (parser.isSet(allowPartialOption)) {
        options.rejectPartialResults = false;
    }

    LayoutTool tool(options);
    const QString command = args.at(0);
    const QString input = args.value(1);

    if (command == QLatin1String("to-edges")) {
        return tool.toEdges(input);
    }
    if (command == QLatin1String("to-zones")) {
        return tool.toZones(input);
    }
    if (command == QLatin1String("validate")) {
        return tool.validate(input);
    }
    if (command == QLatin1String("templates")) {
        return tool.listTemplates();
    }
    if (command == QLatin1String("template")) {
        return tool.instantiateTemplate(input.isEmpty() ? settings.defaultTemplate() : input);
    }

    qCCritical(lcTool) << "Unknown command:" << command;
    QTextStream(stderr) << parser.helpText();
    return LayoutTool::UsageError;
}
