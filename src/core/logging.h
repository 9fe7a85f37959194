// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for Herald
 *
 * This file defines Qt logging categories that enable runtime filtering
 * of log messages. Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcCore) << "Debug message";
 *   qCInfo(lcCore) << "Info message";
 *   qCWarning(lcCore) << "Warning message";
 *   qCCritical(lcCore) << "Critical message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="herald.*=true"                 # Enable all
 *   QT_LOGGING_RULES="herald.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="herald.dbus.*=true"            # Enable D-Bus only
 *   QT_LOGGING_RULES="herald.core.expiry=true"       # Enable expiry scheduling only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing, stale references, coerced hints
 *   qCInfo     - Significant operational events (startup, shutdown, bus name acquired)
 *   qCWarning  - Recoverable errors, malformed client input, presenter faults
 *   qCCritical - System failures preventing normal operation
 */

namespace Herald {

// Core module - notification lifecycle
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcStore)
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcExpiry)
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcSanitizer)
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcHistory)

// Daemon module - process host and rendering channel
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPresenter)

// D-Bus module - all D-Bus adaptor communication
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading/saving
HERALD_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace Herald
