// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>
#include <algorithm>

namespace Herald {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {

// Upper bounds mirror the <max> entries in herald.kcfg
constexpr int MaxTimeoutMs = 86400000;
constexpr int MaxSummaryLengthLimit = 1048576;
constexpr int MaxBodyLengthLimit = 16777216;
constexpr int MaxDisplayLimit = 1000;
constexpr int MaxHistoryLimit = 1000000;

const QLatin1String kCommandGroupPrefix("Command:");

const QStringList kGroups = {
    QStringLiteral("Timeouts"),
    QStringLiteral("Text"),
    QStringLiteral("Display"),
    QStringLiteral("History"),
};

} // anonymous namespace

Settings::Settings(QObject* parent)
    : Settings(QStringLiteral("heraldrc"), parent)
{
}

Settings::Settings(const QString& configName, QObject* parent)
    : ISettings(parent)
    , m_configName(configName)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QStringList Settings::normalizeCapabilities(const QStringList& capabilities)
{
    QStringList result;
    for (const QString& cap : capabilities) {
        const QString normalized = cap.trimmed().toLower();
        if (!normalized.isEmpty() && !result.contains(normalized)) {
            result.append(normalized);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

CommandRules Settings::readCommandRules(const KSharedConfigPtr& config)
{
    CommandRules rules;
    QStringList groups = config->groupList();
    std::sort(groups.begin(), groups.end());

    for (const QString& groupName : std::as_const(groups)) {
        if (!groupName.startsWith(kCommandGroupPrefix)) {
            continue;
        }
        const KConfigGroup group = config->group(groupName);

        CommandRule rule;
        rule.name = groupName.mid(kCommandGroupPrefix.size());
        rule.command = group.readEntry(QLatin1String("Command"), QString()).trimmed();
        if (rule.name.isEmpty() || rule.command.isEmpty()) {
            qCWarning(lcConfig) << "Skipping command group" << groupName << "without a name or Command";
            continue;
        }

        const QString urgency = group.readEntry(QLatin1String("Urgency"), QString());
        if (!urgency.isEmpty()) {
            rule.urgency = urgencyFromString(urgency);
            if (!rule.urgency) {
                qCWarning(lcConfig) << "Skipping command" << rule.name << "with invalid urgency" << urgency
                                    << "(must be low, normal or critical)";
                continue;
            }
        }

        rule.appName = group.readEntry(QLatin1String("AppName"), QString());
        rule.summary = group.readEntry(QLatin1String("Summary"), QString());
        rule.body = group.readEntry(QLatin1String("Body"), QString());
        rules.append(rule);
    }
    return rules;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER_CLAMPED(LowTimeoutMs, m_lowTimeoutMs, lowTimeoutMsChanged, 0, MaxTimeoutMs)
SETTINGS_SETTER_CLAMPED(NormalTimeoutMs, m_normalTimeoutMs, normalTimeoutMsChanged, 0, MaxTimeoutMs)
SETTINGS_SETTER_CLAMPED(CriticalTimeoutMs, m_criticalTimeoutMs, criticalTimeoutMsChanged, 0, MaxTimeoutMs)

SETTINGS_SETTER(bool, BodyMarkup, m_bodyMarkup, bodyMarkupChanged)
SETTINGS_SETTER_CLAMPED(MaxSummaryLength, m_maxSummaryLength, maxSummaryLengthChanged, 0, MaxSummaryLengthLimit)
SETTINGS_SETTER_CLAMPED(MaxBodyLength, m_maxBodyLength, maxBodyLengthChanged, 0, MaxBodyLengthLimit)

SETTINGS_SETTER_CLAMPED(DisplayLimit, m_displayLimit, displayLimitChanged, 0, MaxDisplayLimit)

void Settings::setPresenterCapabilities(const QStringList& capabilities)
{
    const QStringList normalized = normalizeCapabilities(capabilities);
    if (m_presenterCapabilities != normalized) {
        m_presenterCapabilities = normalized;
        Q_EMIT presenterCapabilitiesChanged();
        Q_EMIT settingsChanged();
    }
}

SETTINGS_SETTER(bool, StartupNotification, m_startupNotification, startupNotificationChanged)
SETTINGS_SETTER(const CommandRules&, CommandRules, m_commandRules, commandRulesChanged)

SETTINGS_SETTER(bool, HistoryEnabled, m_historyEnabled, historyEnabledChanged)
SETTINGS_SETTER_CLAMPED(HistoryLimit, m_historyLimit, historyLimitChanged, 1, MaxHistoryLimit)

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(m_configName);

    // Force re-read from disk - KSharedConfig caches in memory, so when the file
    // is edited and the daemon reloads on SIGHUP we need to invalidate the cache first
    config->reparseConfiguration();

    KConfigGroup timeouts = config->group(QStringLiteral("Timeouts"));
    KConfigGroup text = config->group(QStringLiteral("Text"));
    KConfigGroup display = config->group(QStringLiteral("Display"));
    KConfigGroup history = config->group(QStringLiteral("History"));

    // Timeouts with validation (defaults from .kcfg via ConfigDefaults)
    setLowTimeoutMs(
        readValidatedInt(timeouts, "LowTimeoutMs", ConfigDefaults::lowTimeoutMs(), 0, MaxTimeoutMs, "low timeout"));
    setNormalTimeoutMs(readValidatedInt(timeouts, "NormalTimeoutMs", ConfigDefaults::normalTimeoutMs(), 0,
                                        MaxTimeoutMs, "normal timeout"));
    setCriticalTimeoutMs(readValidatedInt(timeouts, "CriticalTimeoutMs", ConfigDefaults::criticalTimeoutMs(), 0,
                                          MaxTimeoutMs, "critical timeout"));

    // Text
    setBodyMarkup(text.readEntry(QLatin1String("BodyMarkup"), ConfigDefaults::bodyMarkup()));
    setMaxSummaryLength(readValidatedInt(text, "MaxSummaryLength", ConfigDefaults::maxSummaryLength(), 0,
                                         MaxSummaryLengthLimit, "summary length"));
    setMaxBodyLength(readValidatedInt(text, "MaxBodyLength", ConfigDefaults::maxBodyLength(), 0, MaxBodyLengthLimit,
                                      "body length"));

    // Display
    setDisplayLimit(
        readValidatedInt(display, "DisplayLimit", ConfigDefaults::displayLimit(), 0, MaxDisplayLimit, "display limit"));
    setPresenterCapabilities(
        display.readEntry(QLatin1String("PresenterCapabilities"), ConfigDefaults::presenterCapabilities()));
    setStartupNotification(
        display.readEntry(QLatin1String("StartupNotification"), ConfigDefaults::startupNotification()));

    // Commands (groups matching Command:*)
    setCommandRules(readCommandRules(config));

    // History
    setHistoryEnabled(history.readEntry(QLatin1String("Enabled"), ConfigDefaults::historyEnabled()));
    setHistoryLimit(
        readValidatedInt(history, "Limit", ConfigDefaults::historyLimit(), 1, MaxHistoryLimit, "history limit"));

    qCInfo(lcConfig) << "Settings loaded from" << m_configName;
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(m_configName);
    KConfigGroup timeouts = config->group(QStringLiteral("Timeouts"));
    KConfigGroup text = config->group(QStringLiteral("Text"));
    KConfigGroup display = config->group(QStringLiteral("Display"));
    KConfigGroup history = config->group(QStringLiteral("History"));

    timeouts.writeEntry(QLatin1String("LowTimeoutMs"), m_lowTimeoutMs);
    timeouts.writeEntry(QLatin1String("NormalTimeoutMs"), m_normalTimeoutMs);
    timeouts.writeEntry(QLatin1String("CriticalTimeoutMs"), m_criticalTimeoutMs);

    text.writeEntry(QLatin1String("BodyMarkup"), m_bodyMarkup);
    text.writeEntry(QLatin1String("MaxSummaryLength"), m_maxSummaryLength);
    text.writeEntry(QLatin1String("MaxBodyLength"), m_maxBodyLength);

    display.writeEntry(QLatin1String("DisplayLimit"), m_displayLimit);
    display.writeEntry(QLatin1String("PresenterCapabilities"), m_presenterCapabilities);
    display.writeEntry(QLatin1String("StartupNotification"), m_startupNotification);

    // Command groups - delete all old groups, rewrite current ones
    const QStringList allGroups = config->groupList();
    for (const QString& groupName : allGroups) {
        if (groupName.startsWith(kCommandGroupPrefix)) {
            config->deleteGroup(groupName);
        }
    }
    for (const CommandRule& rule : std::as_const(m_commandRules)) {
        if (rule.name.isEmpty()) {
            continue;
        }
        KConfigGroup group = config->group(QString(kCommandGroupPrefix + rule.name));
        group.writeEntry(QLatin1String("Command"), rule.command);
        if (rule.urgency) {
            group.writeEntry(QLatin1String("Urgency"), urgencyToString(*rule.urgency));
        }
        if (!rule.appName.isEmpty()) {
            group.writeEntry(QLatin1String("AppName"), rule.appName);
        }
        if (!rule.summary.isEmpty()) {
            group.writeEntry(QLatin1String("Summary"), rule.summary);
        }
        if (!rule.body.isEmpty()) {
            group.writeEntry(QLatin1String("Body"), rule.body);
        }
    }

    history.writeEntry(QLatin1String("Enabled"), m_historyEnabled);
    history.writeEntry(QLatin1String("Limit"), m_historyLimit);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write settings to" << m_configName;
    }
}

void Settings::reset()
{
    // Clear all config groups and reload with defaults
    auto config = KSharedConfig::openConfig(m_configName);

    for (const QString& groupName : kGroups) {
        config->deleteGroup(groupName);
    }
    const QStringList allGroups = config->groupList();
    for (const QString& groupName : allGroups) {
        if (groupName.startsWith(kCommandGroupPrefix)) {
            config->deleteGroup(groupName);
        }
    }
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to reset settings in" << m_configName;
    }

    load();
    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace Herald
