// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Zoned {

// Core module categories
Q_LOGGING_CATEGORY(lcConverter, "zoned.core.converter", QtInfoMsg)
Q_LOGGING_CATEGORY(lcValidator, "zoned.core.validator", QtInfoMsg)
Q_LOGGING_CATEGORY(lcTemplates, "zoned.core.templates", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSerialization, "zoned.core.serialization", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "zoned.config", QtInfoMsg)

// Command line tool categories
Q_LOGGING_CATEGORY(lcTool, "zoned.tool", QtInfoMsg)

} // namespace Zoned
