// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "zoned_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Zoned
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcConverter) << "Debug message";
 *   qCWarning(lcValidator) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="zoned.*=true"                   # Enable all
 *   QT_LOGGING_RULES="zoned.*.debug=false"            # Disable debug only
 *   QT_LOGGING_RULES="zoned.core.converter=true"      # Enable converter only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (conversion summaries)
 *   qCInfo     - Significant operational events (settings loaded, file written)
 *   qCWarning  - Recoverable errors, invalid input, dropped zones or regions
 *   qCCritical - Failures preventing normal operation
 */

namespace Zoned {

// Core module - geometry types, conversion, validation, templates
ZONED_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConverter)
ZONED_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcValidator)
ZONED_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTemplates)
ZONED_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSerialization)

// Configuration module - settings loading/saving
ZONED_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Command line tool
ZONED_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcTool)

} // namespace Zoned
