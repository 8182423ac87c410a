// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "convertersettings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include "../core/templatecatalog.h"
#include <KConfigGroup>

namespace Zoned {

namespace {
const QString ConverterGroup = QStringLiteral("Converter");
}

ConverterSettings::ConverterSettings(KSharedConfig::Ptr config)
    : m_config(std::move(config))
{
    reset();
}

void ConverterSettings::load()
{
    // Force re-read from disk - KSharedConfig caches in memory
    m_config->reparseConfiguration();

    const KConfigGroup converter = m_config->group(ConverterGroup);

    m_indentedJson = converter.readEntry(QLatin1String("IndentedJson"), ConfigDefaults::indentedJson());
    m_strictValidation = converter.readEntry(QLatin1String("StrictValidation"), ConfigDefaults::strictValidation());
    m_rejectPartialResults =
        converter.readEntry(QLatin1String("RejectPartialResults"), ConfigDefaults::rejectPartialResults());

    const QString templateId = converter.readEntry(QLatin1String("DefaultTemplate"), ConfigDefaults::defaultTemplate());
    if (!TemplateCatalog::hasTemplate(templateId)) {
        qCWarning(lcConfig) << "Invalid default template" << templateId << "using default"
                            << ConfigDefaults::defaultTemplate();
        m_defaultTemplate = ConfigDefaults::defaultTemplate();
    } else {
        m_defaultTemplate = templateId;
    }

    qCInfo(lcConfig) << "Converter settings loaded - indentedJson:" << m_indentedJson
                     << "strictValidation:" << m_strictValidation
                     << "rejectPartialResults:" << m_rejectPartialResults << "defaultTemplate:" << m_defaultTemplate;
}

void ConverterSettings::save() const
{
    KConfigGroup converter = m_config->group(ConverterGroup);

    converter.writeEntry(QLatin1String("IndentedJson"), m_indentedJson);
    converter.writeEntry(QLatin1String("StrictValidation"), m_strictValidation);
    converter.writeEntry(QLatin1String("RejectPartialResults"), m_rejectPartialResults);
    converter.writeEntry(QLatin1String("DefaultTemplate"), m_defaultTemplate);

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to write converter settings";
    }
}

void ConverterSettings::reset()
{
    m_indentedJson = ConfigDefaults::indentedJson();
    m_strictValidation = ConfigDefaults::strictValidation();
    m_rejectPartialResults = ConfigDefaults::rejectPartialResults();
    m_defaultTemplate = ConfigDefaults::defaultTemplate();
}

void ConverterSettings::setDefaultTemplate(const QString& templateId)
{
    if (!TemplateCatalog::hasTemplate(templateId)) {
        qCWarning(lcConfig) << "Ignoring unknown default template" << templateId;
        return;
    }
    m_defaultTemplate = templateId;
}

} // namespace Zoned
