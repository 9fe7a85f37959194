// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald.h" // Generated from herald.kcfg via KConfigXT

#include <QString>
#include <QStringList>

namespace Herald {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated HeraldConfig class to provide
 * static access to default values. The .kcfg file is the SINGLE SOURCE OF TRUTH
 * for all defaults - this class simply exposes those generated defaults.
 *
 * Usage:
 *   int ms = ConfigDefaults::normalTimeoutMs();  // Returns 10000 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Timeouts
    // ═══════════════════════════════════════════════════════════════════════════

    static int lowTimeoutMs() { return instance().defaultLowTimeoutMsValue(); }
    static int normalTimeoutMs() { return instance().defaultNormalTimeoutMsValue(); }
    static int criticalTimeoutMs() { return instance().defaultCriticalTimeoutMsValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Text
    // ═══════════════════════════════════════════════════════════════════════════

    static bool bodyMarkup() { return instance().defaultBodyMarkupValue(); }
    static int maxSummaryLength() { return instance().defaultMaxSummaryLengthValue(); }
    static int maxBodyLength() { return instance().defaultMaxBodyLengthValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Display
    // ═══════════════════════════════════════════════════════════════════════════

    static int displayLimit() { return instance().defaultDisplayLimitValue(); }
    static QStringList presenterCapabilities() { return instance().defaultPresenterCapabilitiesValue(); }
    static bool startupNotification() { return instance().defaultStartupNotificationValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // History
    // ═══════════════════════════════════════════════════════════════════════════

    static bool historyEnabled() { return instance().defaultHistoryEnabledValue(); }
    static int historyLimit() { return instance().defaultHistoryLimitValue(); }

private:
    // Lazily-initialized singleton instance
    static HeraldConfig& instance()
    {
        static HeraldConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace Herald
