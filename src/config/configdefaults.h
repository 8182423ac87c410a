// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "zoned.h" // Generated from zoned.kcfg via KConfigXT

#include <QString>

namespace Zoned {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated ZonedConfig class. The .kcfg file is the
 * single source of truth for all defaults.
 *
 * Usage:
 *   bool strict = ConfigDefaults::strictValidation();  // true (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Converter Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static bool indentedJson() { return instance().defaultIndentedJsonValue(); }
    static bool strictValidation() { return instance().defaultStrictValidationValue(); }
    static bool rejectPartialResults() { return instance().defaultRejectPartialResultsValue(); }
    static QString defaultTemplate() { return instance().defaultDefaultTemplateValue(); }

private:
    // Lazily-initialized singleton instance
    static ZonedConfig& instance()
    {
        static ZonedConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace Zoned
