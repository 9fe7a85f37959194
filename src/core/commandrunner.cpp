// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "commandrunner.h"
#include "logging.h"
#include "textsanitizer.h"

#include <QHash>
#include <QProcess>
#include <QStringList>

namespace Herald {

namespace CommandRunner {

bool globMatch(const QString& pattern, const QString& value)
{
    if (!pattern.contains(QLatin1Char('*'))) {
        return pattern.compare(value, Qt::CaseInsensitive) == 0;
    }

    const QStringList parts = pattern.split(QLatin1Char('*'));
    const QString& head = parts.first();
    const QString& tail = parts.last();
    if (!value.startsWith(head, Qt::CaseInsensitive)) {
        return false;
    }

    qsizetype pos = head.size();
    for (qsizetype i = 1; i < parts.size() - 1; ++i) {
        const QString& part = parts.at(i);
        if (part.isEmpty()) {
            continue;
        }
        const qsizetype found = value.indexOf(part, pos, Qt::CaseInsensitive);
        if (found < 0) {
            return false;
        }
        pos = found + part.size();
    }

    // The tail must not overlap what the middle parts consumed
    return value.size() - pos >= tail.size() && value.endsWith(tail, Qt::CaseInsensitive);
}

bool matches(const CommandRule& rule, const Notification& notification)
{
    if (rule.urgency && *rule.urgency != notification.hints.urgency) {
        return false;
    }
    if (!rule.appName.isEmpty() && !globMatch(rule.appName, notification.appName)) {
        return false;
    }
    if (!rule.summary.isEmpty() && !globMatch(rule.summary, notification.summary)) {
        return false;
    }
    if (!rule.body.isEmpty() && !globMatch(rule.body, TextSanitizer::stripMarkup(notification.body))) {
        return false;
    }
    return true;
}

QString shellQuote(const QString& text)
{
    QString quoted = text;
    quoted.replace(QLatin1Char('\''), QLatin1String("'\\''"));
    return QLatin1Char('\'') + quoted + QLatin1Char('\'');
}

QString expand(const QString& command, const Notification& notification)
{
    const QHash<QString, QString> values = {
        {QStringLiteral("id"), QString::number(notification.id)},
        {QStringLiteral("app_name"), notification.appName},
        {QStringLiteral("app_icon"), notification.appIcon},
        {QStringLiteral("summary"), notification.summary},
        {QStringLiteral("body"), TextSanitizer::stripMarkup(notification.body)},
        {QStringLiteral("urgency"), urgencyToString(notification.hints.urgency)},
        {QStringLiteral("category"), notification.hints.category},
    };

    // Single pass, so text coming from a placeholder is never expanded again
    QString result;
    result.reserve(command.size());
    qsizetype pos = 0;
    while (pos < command.size()) {
        const qsizetype open = command.indexOf(QLatin1Char('{'), pos);
        if (open < 0) {
            break;
        }
        const qsizetype close = command.indexOf(QLatin1Char('}'), open + 1);
        if (close < 0) {
            break;
        }
        result += QStringView(command).mid(pos, open - pos);
        const QString key = command.mid(open + 1, close - open - 1);
        const auto it = values.constFind(key);
        if (it != values.constEnd()) {
            result += shellQuote(it.value());
        } else {
            result += QStringView(command).mid(open, close - open + 1);
        }
        pos = close + 1;
    }
    result += QStringView(command).mid(pos);
    return result;
}

int run(const CommandRules& rules, const Notification& notification)
{
    int started = 0;
    for (const CommandRule& rule : rules) {
        if (rule.command.isEmpty() || !matches(rule, notification)) {
            continue;
        }
        const QString command = expand(rule.command, notification);
        qCDebug(lcCore) << "Running command" << rule.name << "for notification" << notification.id;
        if (!QProcess::startDetached(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), command})) {
            qCWarning(lcCore) << "Failed to start command" << rule.name << "for notification" << notification.id;
            continue;
        }
        ++started;
    }
    return started;
}

} // namespace CommandRunner

} // namespace Herald
