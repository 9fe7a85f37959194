// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>
#include <KSharedConfig>

namespace Herald {

/**
 * @brief Global settings for Herald
 *
 * Implements the ISettings interface with KConfig integration. Values are read
 * from heraldrc, validated against the ranges in herald.kcfg, and fall back to
 * the generated defaults when out of range.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class HERALD_EXPORT Settings : public ISettings
{
    Q_OBJECT

    // Timeouts
    Q_PROPERTY(int lowTimeoutMs READ lowTimeoutMs WRITE setLowTimeoutMs NOTIFY lowTimeoutMsChanged)
    Q_PROPERTY(int normalTimeoutMs READ normalTimeoutMs WRITE setNormalTimeoutMs NOTIFY normalTimeoutMsChanged)
    Q_PROPERTY(
        int criticalTimeoutMs READ criticalTimeoutMs WRITE setCriticalTimeoutMs NOTIFY criticalTimeoutMsChanged)

    // Text
    Q_PROPERTY(bool bodyMarkup READ bodyMarkup WRITE setBodyMarkup NOTIFY bodyMarkupChanged)
    Q_PROPERTY(int maxSummaryLength READ maxSummaryLength WRITE setMaxSummaryLength NOTIFY maxSummaryLengthChanged)
    Q_PROPERTY(int maxBodyLength READ maxBodyLength WRITE setMaxBodyLength NOTIFY maxBodyLengthChanged)

    // Display
    Q_PROPERTY(int displayLimit READ displayLimit WRITE setDisplayLimit NOTIFY displayLimitChanged)
    Q_PROPERTY(QStringList presenterCapabilities READ presenterCapabilities WRITE setPresenterCapabilities NOTIFY
                   presenterCapabilitiesChanged)
    Q_PROPERTY(bool startupNotification READ startupNotification WRITE setStartupNotification NOTIFY
                   startupNotificationChanged)

    // History
    Q_PROPERTY(bool historyEnabled READ historyEnabled WRITE setHistoryEnabled NOTIFY historyEnabledChanged)
    Q_PROPERTY(int historyLimit READ historyLimit WRITE setHistoryLimit NOTIFY historyLimitChanged)

public:
    explicit Settings(QObject* parent = nullptr);

    /**
     * @param configName KConfig file name to use instead of heraldrc
     */
    explicit Settings(const QString& configName, QObject* parent = nullptr);
    ~Settings() override = default;

    // No singleton - use dependency injection instead

    // ISettings interface implementation
    int lowTimeoutMs() const override
    {
        return m_lowTimeoutMs;
    }
    void setLowTimeoutMs(int ms) override;
    int normalTimeoutMs() const override
    {
        return m_normalTimeoutMs;
    }
    void setNormalTimeoutMs(int ms) override;
    int criticalTimeoutMs() const override
    {
        return m_criticalTimeoutMs;
    }
    void setCriticalTimeoutMs(int ms) override;

    bool bodyMarkup() const override
    {
        return m_bodyMarkup;
    }
    void setBodyMarkup(bool enabled) override;
    int maxSummaryLength() const override
    {
        return m_maxSummaryLength;
    }
    void setMaxSummaryLength(int length) override;
    int maxBodyLength() const override
    {
        return m_maxBodyLength;
    }
    void setMaxBodyLength(int length) override;

    int displayLimit() const override
    {
        return m_displayLimit;
    }
    void setDisplayLimit(int limit) override;
    QStringList presenterCapabilities() const override
    {
        return m_presenterCapabilities;
    }
    void setPresenterCapabilities(const QStringList& capabilities) override;
    bool startupNotification() const override
    {
        return m_startupNotification;
    }
    void setStartupNotification(bool enabled) override;

    CommandRules commandRules() const override
    {
        return m_commandRules;
    }
    void setCommandRules(const CommandRules& rules) override;

    bool historyEnabled() const override
    {
        return m_historyEnabled;
    }
    void setHistoryEnabled(bool enabled) override;
    int historyLimit() const override
    {
        return m_historyLimit;
    }
    void setHistoryLimit(int limit) override;

    // Persistence
    void load() override;
    void save() override;
    void reset() override;

    QString configName() const
    {
        return m_configName;
    }

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static QStringList normalizeCapabilities(const QStringList& capabilities);
    static CommandRules readCommandRules(const KSharedConfigPtr& config);

    QString m_configName;

    // Timeouts
    int m_lowTimeoutMs = Defaults::LowTimeoutMs;
    int m_normalTimeoutMs = Defaults::NormalTimeoutMs;
    int m_criticalTimeoutMs = Defaults::CriticalTimeoutMs;

    // Text
    bool m_bodyMarkup = true;
    int m_maxSummaryLength = Defaults::MaxSummaryLength;
    int m_maxBodyLength = Defaults::MaxBodyLength;

    // Display
    int m_displayLimit = Defaults::DisplayLimit;
    QStringList m_presenterCapabilities;
    bool m_startupNotification = false;

    // Commands
    CommandRules m_commandRules;

    // History
    bool m_historyEnabled = true;
    int m_historyLimit = Defaults::HistoryLimit;
};

} // namespace Herald
