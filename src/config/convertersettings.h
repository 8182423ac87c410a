// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "zoned_export.h"
#include <KSharedConfig>
#include <QString>

namespace Zoned {

/**
 * @brief Converter settings backed by KConfig
 *
 * Reads and writes the [Converter] group of zonedrc. Missing or invalid
 * entries fall back to ConfigDefaults.
 */
class ZONED_EXPORT ConverterSettings
{
public:
    /**
     * @param config Config to use; defaults to the user's zonedrc
     */
    explicit ConverterSettings(KSharedConfig::Ptr config = KSharedConfig::openConfig(QStringLiteral("zonedrc")));

    void load();
    void save() const;

    /**
     * @brief Reset all values to ConfigDefaults (does not write to disk)
     */
    void reset();

    bool indentedJson() const { return m_indentedJson; }
    void setIndentedJson(bool indented) { m_indentedJson = indented; }

    bool strictValidation() const { return m_strictValidation; }
    void setStrictValidation(bool strict) { m_strictValidation = strict; }

    bool rejectPartialResults() const { return m_rejectPartialResults; }
    void setRejectPartialResults(bool reject) { m_rejectPartialResults = reject; }

    QString defaultTemplate() const { return m_defaultTemplate; }
    void setDefaultTemplate(const QString& templateId);

private:
    KSharedConfig::Ptr m_config;

    bool m_indentedJson;
    bool m_strictValidation;
    bool m_rejectPartialResults;
    QString m_defaultTemplate;
};

} // namespace Zoned
