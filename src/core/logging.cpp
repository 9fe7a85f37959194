// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace Herald {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "herald.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "herald.core.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExpiry, "herald.core.expiry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSanitizer, "herald.core.sanitizer", QtInfoMsg)
Q_LOGGING_CATEGORY(lcHistory, "herald.core.history", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "herald.daemon", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPresenter, "herald.daemon.presenter", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "herald.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "herald.config", QtInfoMsg)

} // namespace Herald
