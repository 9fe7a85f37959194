// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "types.h"
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace Herald {

/**
 * @brief Abstract interface for settings management
 *
 * Allows dependency inversion - components depend on this interface
 * rather than concrete Settings implementation.
 */
class HERALD_EXPORT ISettings : public QObject
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // Timeouts (milliseconds, 0 = never expire)
    // ═══════════════════════════════════════════════════════════════════════════

    virtual int lowTimeoutMs() const = 0;
    virtual void setLowTimeoutMs(int ms) = 0;
    virtual int normalTimeoutMs() const = 0;
    virtual void setNormalTimeoutMs(int ms) = 0;
    virtual int criticalTimeoutMs() const = 0;
    virtual void setCriticalTimeoutMs(int ms) = 0;

    /**
     * @brief Default timeout for @p urgency, used when a client passes -1
     */
    int timeoutForUrgency(Urgency urgency) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Text
    // ═══════════════════════════════════════════════════════════════════════════

    virtual bool bodyMarkup() const = 0;
    virtual void setBodyMarkup(bool enabled) = 0;
    virtual int maxSummaryLength() const = 0;
    virtual void setMaxSummaryLength(int length) = 0;
    virtual int maxBodyLength() const = 0;
    virtual void setMaxBodyLength(int length) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Display
    // ═══════════════════════════════════════════════════════════════════════════

    virtual int displayLimit() const = 0;
    virtual void setDisplayLimit(int limit) = 0;
    virtual QStringList presenterCapabilities() const = 0;
    virtual void setPresenterCapabilities(const QStringList& capabilities) = 0;
    virtual bool startupNotification() const = 0;
    virtual void setStartupNotification(bool enabled) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Commands ([Command:<name>] groups)
    // ═══════════════════════════════════════════════════════════════════════════

    virtual CommandRules commandRules() const = 0;
    virtual void setCommandRules(const CommandRules& rules) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // History
    // ═══════════════════════════════════════════════════════════════════════════

    virtual bool historyEnabled() const = 0;
    virtual void setHistoryEnabled(bool enabled) = 0;
    virtual int historyLimit() const = 0;
    virtual void setHistoryLimit(int limit) = 0;

    // Persistence
    virtual void load() = 0;
    virtual void save() = 0;
    virtual void reset() = 0;

Q_SIGNALS:
    void settingsChanged();
    void lowTimeoutMsChanged();
    void normalTimeoutMsChanged();
    void criticalTimeoutMsChanged();
    void bodyMarkupChanged();
    void maxSummaryLengthChanged();
    void maxBodyLengthChanged();
    void displayLimitChanged();
    void presenterCapabilitiesChanged();
    void startupNotificationChanged();
    void commandRulesChanged();
    void historyEnabledChanged();
    void historyLimitChanged();
};

/**
 * @brief Everything the presenter needs to draw one notification
 *
 * @c bodyMarkup is derived by TextSanitizer::toDisplayMarkup() and is always
 * well formed; @c body is the stored caller text.
 */
struct HERALD_EXPORT DisplayRequest
{
    quint32 id = 0;
    QString appName;
    QString appIcon;
    QString summary;
    QString body;
    QString bodyMarkup;
    NotificationActions actions;
    QVariantMap hints;
    Urgency urgency = Urgency::Normal;
    int timeoutMs = 0;
    bool replaced = false;
};

/**
 * @brief Abstract interface for the rendering collaborator
 *
 * Separates UI concerns from the daemon. The server only sends display and
 * withdraw requests; user interaction comes back through the signals.
 */
class HERALD_EXPORT INotificationPresenter : public QObject
{
    Q_OBJECT

public:
    explicit INotificationPresenter(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~INotificationPresenter() override;

    /**
     * @brief Capability strings the renderer supports
     */
    virtual QStringList capabilities() const = 0;

    /**
     * @brief Show a new notification or update a replaced one
     * @return false if the presenter refused the request
     */
    virtual bool present(const DisplayRequest& request) = 0;

    /**
     * @brief Remove a notification from the screen
     */
    virtual void withdraw(quint32 id, CloseReason reason) = 0;

Q_SIGNALS:
    void actionActivated(quint32 id, const QString& actionKey);
    void dismissed(quint32 id);
};

} // namespace Herald

Q_DECLARE_METATYPE(Herald::DisplayRequest)
