// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace Zoned {

class ConverterSettings;

/**
 * @brief Commands of the zoned-layout command line tool
 *
 * Each command reads its input from a file (or stdin for "-" or an empty
 * path), writes to the configured output (stdout when empty) and returns a
 * process exit code.
 */
class LayoutTool
{
public:
    enum ExitCode {
        Success = 0,
        Invalid = 1,     ///< validate: layout invalid; template: unknown id
        InputError = 2,  ///< Unreadable input, malformed JSON or unwritable output
        Rejected = 3,    ///< Strict validation failed or partial result rejected
        UsageError = 64
    };

    struct Options
    {
        bool indentedJson = true;
        bool strictValidation = true;
        bool rejectPartialResults = false;
        QString outputPath; ///< Empty for stdout

        static Options fromSettings(const ConverterSettings& settings);
    };

    explicit LayoutTool(const Options& options);

    /// Zone layout JSON in, edge layout JSON out
    int toEdges(const QString& inputPath);

    /// Edge layout JSON in, zone layout JSON out
    int toZones(const QString& inputPath);

    /// Prints "valid" or "invalid" for an edge layout
    int validate(const QString& inputPath);

    /// One "id<TAB>name<TAB>description" line per built-in template
    int listTemplates();

    int instantiateTemplate(const QString& templateId);

private:
    std::optional<QJsonObject> readInput(const QString& inputPath) const;
    bool writeOutput(const QByteArray& data) const;
    bool writeJson(const QJsonObject& json) const;

    Options m_options;
};

} // namespace Zoned
