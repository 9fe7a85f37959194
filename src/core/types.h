// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QString>
#include <QVector>
#include <QMetaType>
#include <optional>

namespace Herald {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types - protocol enumerations and parameter objects
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Urgency levels carried in the "urgency" hint
 *
 * Consumed by the presenter for display priority and by the server
 * to pick a default expiry. Never affects lifecycle rules otherwise.
 */
enum class Urgency {
    Low = 0,
    Normal = 1,
    Critical = 2
};

/**
 * @brief Reason codes sent with the NotificationClosed signal
 */
enum class CloseReason : uint {
    Expired = 1, ///< The notification expired
    Dismissed = 2, ///< The notification was dismissed by the user
    CallerClosed = 3, ///< Closed by a call to CloseNotification
    Undefined = 4 ///< Undefined/reserved reasons (display limit, presenter fault)
};

/**
 * @brief Result of an operation that may race with another close/replace
 *
 * AlreadyGone is an expected outcome (the UI and callers race benignly),
 * not an error.
 */
enum class Outcome {
    Applied,
    AlreadyGone
};

/**
 * @brief One (key, label) pair from the flat Notify actions list
 */
struct HERALD_EXPORT NotificationAction
{
    QString key;
    QString label;

    bool operator==(const NotificationAction&) const = default;
};

using NotificationActions = QVector<NotificationAction>;

/**
 * @brief A shell command run when a matching notification arrives
 *
 * Filters are case-insensitive globs where '*' matches any run of characters;
 * an empty filter matches everything.
 */
struct HERALD_EXPORT CommandRule
{
    QString name;
    QString command;
    std::optional<Urgency> urgency; ///< nullopt = every urgency
    QString appName;
    QString summary;
    QString body;

    bool operator==(const CommandRule&) const = default;
};

using CommandRules = QVector<CommandRule>;

/**
 * @brief Static metadata returned by GetServerInformation
 */
struct HERALD_EXPORT ServerInformation
{
    QString name;
    QString vendor;
    QString version;
    QString specVersion;
};

/**
 * @brief Urgency to its lower-case protocol name ("low", "normal", "critical")
 */
HERALD_EXPORT QString urgencyToString(Urgency urgency);

/**
 * @brief Parse "low", "normal" or "critical" (case-insensitive)
 */
HERALD_EXPORT std::optional<Urgency> urgencyFromString(const QString& name);

/**
 * @brief Close reason to a short name for logging
 */
HERALD_EXPORT QString closeReasonToString(CloseReason reason);

} // namespace Herald

Q_DECLARE_METATYPE(Herald::CloseReason)
