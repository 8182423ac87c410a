// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layouttypes.h"
#include "zoned_export.h"
#include <QString>
#include <QVector>
#include <optional>

namespace Zoned {

/**
 * @brief Built-in layout template definition
 */
struct ZONED_EXPORT LayoutTemplate
{
    QString id;          ///< Template identifier (e.g. "split")
    QString name;        ///< Display name
    QString icon;        ///< Single-character icon glyph
    QString description; ///< Human-readable description
    QVector<Zone> zones; ///< Zone configuration, normalized coordinates
};

/**
 * @brief Read-only catalog of the built-in layout templates
 *
 * Usage:
 *   auto layout = TemplateCatalog::createLayoutFromTemplate(QStringLiteral("quarters"));
 *   if (!layout) { // handle unknown id }
 */
class ZONED_EXPORT TemplateCatalog
{
public:
    /**
     * @brief All built-in templates in display order
     */
    static const QVector<LayoutTemplate>& builtinTemplates();

    /**
     * @brief Get a template by id
     * @return Template, or std::nullopt (with a warning) for an unknown id
     */
    static std::optional<LayoutTemplate> templateById(const QString& templateId);

    static bool hasTemplate(const QString& templateId);

    static int templateCount();

    /**
     * @brief Create a zone layout from a template
     * @param templateId Template to instantiate
     * @return Layout with the stable id "template-<templateId>", the template
     *         name and a copy of its zones; std::nullopt for an unknown id
     */
    static std::optional<ZoneLayout> createLayoutFromTemplate(const QString& templateId);
};

} // namespace Zoned
