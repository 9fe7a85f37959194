// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "notification.h"
#include "types.h"
#include <QString>

namespace Herald {

/**
 * @brief User commands triggered by incoming notifications
 *
 * Each CommandRule names a shell command and optional filters. For every
 * notification the matching rules are expanded and started detached through
 * /bin/sh -c; the daemon never waits for them.
 *
 * Placeholders in the command text:
 *   {id} {app_name} {app_icon} {summary} {body} {urgency} {category}
 * Each expands to a single-quoted shell word, so caller text is never parsed
 * by the shell. {body} is the plain text with markup removed. Unknown
 * placeholders are left as written.
 */
namespace CommandRunner {

/**
 * @brief Case-insensitive glob match where '*' matches any run of characters
 *
 * A pattern without '*' must equal the whole value.
 */
HERALD_EXPORT bool globMatch(const QString& pattern, const QString& value);

/**
 * @brief Whether @p rule applies to @p notification (urgency and all filters)
 */
HERALD_EXPORT bool matches(const CommandRule& rule, const Notification& notification);

/**
 * @brief Quote @p text as one POSIX shell word
 */
HERALD_EXPORT QString shellQuote(const QString& text);

/**
 * @brief Substitute the placeholders of @p command for @p notification
 */
HERALD_EXPORT QString expand(const QString& command, const Notification& notification);

/**
 * @brief Start every rule that matches @p notification
 * @return Number of commands started
 */
HERALD_EXPORT int run(const CommandRules& rules, const Notification& notification);

} // namespace CommandRunner

} // namespace Herald
