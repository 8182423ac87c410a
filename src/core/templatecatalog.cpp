// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "templatecatalog.h"
#include "constants.h"
#include "logging.h"

namespace Zoned {

namespace {

const LayoutTemplate* findTemplate(const QString& templateId)
{
    for (const LayoutTemplate& entry : TemplateCatalog::builtinTemplates()) {
        if (entry.id == templateId) {
            return &entry;
        }
    }
    return nullptr;
}

QVector<LayoutTemplate> createBuiltinTemplates()
{
    auto zone = [](const char* name, qreal x, qreal y, qreal w, qreal h) {
        return Zone{QString::fromUtf8(name), x, y, w, h};
    };

    return {
        LayoutTemplate{QStringLiteral("split"), QStringLiteral("Split"), QStringLiteral("⫿"),
                       QStringLiteral("50/50 split - Left and Right"),
                       {
                           zone("Left", 0.0, 0.0, 0.5, 1.0),
                           zone("Right", 0.5, 0.0, 0.5, 1.0),
                       }},
        LayoutTemplate{QStringLiteral("triple"), QStringLiteral("Triple"), QStringLiteral("⫴"),
                       QStringLiteral("33/33/33 columns"),
                       {
                           zone("Left", 0.0, 0.0, 0.333, 1.0),
                           zone("Center", 0.333, 0.0, 0.334, 1.0),
                           zone("Right", 0.667, 0.0, 0.333, 1.0),
                       }},
        LayoutTemplate{QStringLiteral("wide"), QStringLiteral("Wide"), QStringLiteral("◧"),
                       QStringLiteral("25/50/25 - Center-focused"),
                       {
                           zone("Left", 0.0, 0.0, 0.25, 1.0),
                           zone("Center", 0.25, 0.0, 0.5, 1.0),
                           zone("Right", 0.75, 0.0, 0.25, 1.0),
                       }},
        LayoutTemplate{QStringLiteral("quarters"), QStringLiteral("Quarters"), QStringLiteral("⊞"),
                       QStringLiteral("2x2 grid layout"),
                       {
                           zone("Top-Left", 0.0, 0.0, 0.5, 0.5),
                           zone("Top-Right", 0.5, 0.0, 0.5, 0.5),
                           zone("Bottom-Left", 0.0, 0.5, 0.5, 0.5),
                           zone("Bottom-Right", 0.5, 0.5, 0.5, 0.5),
                       }},
        LayoutTemplate{QStringLiteral("triple_stack"), QStringLiteral("Triple Stack"), QStringLiteral("⊡"),
                       QStringLiteral("Three columns with stacked right panel"),
                       {
                           zone("Left", 0.0, 0.0, 0.333, 1.0),
                           zone("Center", 0.333, 0.0, 0.334, 1.0),
                           zone("Top-Right", 0.667, 0.0, 0.333, 0.5),
                           zone("Bottom-Right", 0.667, 0.5, 0.333, 0.5),
                       }},
    };
}

} // namespace

const QVector<LayoutTemplate>& TemplateCatalog::builtinTemplates()
{
    static const QVector<LayoutTemplate> s_templates = createBuiltinTemplates();
    return s_templates;
}

std::optional<LayoutTemplate> TemplateCatalog::templateById(const QString& templateId)
{
    const LayoutTemplate* entry = findTemplate(templateId);
    if (!entry) {
        qCWarning(lcTemplates) << "Template not found:" << templateId;
        return std::nullopt;
    }
    return *entry;
}

bool TemplateCatalog::hasTemplate(const QString& templateId)
{
    return findTemplate(templateId) != nullptr;
}

int TemplateCatalog::templateCount()
{
    return static_cast<int>(builtinTemplates().size());
}

std::optional<ZoneLayout> TemplateCatalog::createLayoutFromTemplate(const QString& templateId)
{
    const LayoutTemplate* entry = findTemplate(templateId);
    if (!entry) {
        qCWarning(lcTemplates) << "Cannot create layout from unknown template:" << templateId;
        return std::nullopt;
    }

    ZoneLayout layout;
    layout.id = QString(TemplateIds::LayoutIdPrefix) + entry->id;
    layout.name = entry->name;
    layout.zones = entry->zones;

    qCDebug(lcTemplates) << "Created layout from template" << templateId << ":" << layout.id;
    return layout;
}

} // namespace Zoned
