// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "expiryscheduler.h"
#include "interactiondispatcher.h"
#include "notification.h"
#include "notificationstore.h"
#include "types.h"
#include <QObject>
#include <QPointer>
#include <QStringList>
#include <QVariantMap>
#include <memory>
#include <optional>

namespace Herald {

class ISettings;
struct DisplayRequest;
class INotificationPresenter;
class NotificationHistory;

/**
 * @brief Arguments of one Notify call, as received from the bus
 */
struct HERALD_EXPORT NotifyRequest
{
    QString appName;
    quint32 replacesId = 0;
    QString appIcon;
    QString summary;
    QString body;
    QStringList actions; ///< Flat [key, label, ...] list
    QVariantMap hints;
    int expireTimeout = -1; ///< -1 = server default, 0 = never, otherwise milliseconds
};

/**
 * @brief Protocol core of the notification server
 *
 * Owns all daemon-wide notification state: the store (with its id allocator),
 * the expiry scheduler and the interaction dispatcher. The D-Bus adaptor is a
 * thin facade over this class, which keeps it testable without a bus.
 *
 * Lifecycle of a notification:
 *   notify() → sanitize → store → schedule expiry → history → commands → present
 *   expiry / user action / closeNotification() → dispatcher → NotificationClosed
 */
class HERALD_EXPORT NotificationServer : public QObject
{
    Q_OBJECT

public:
    /**
     * @param settings Server settings (not owned, must outlive the server)
     * @param presenter Rendering collaborator (not owned)
     * @param history Optional history log (not owned)
     * @param maxId Largest id handed out before wrapping
     */
    NotificationServer(ISettings* settings, INotificationPresenter* presenter, NotificationHistory* history = nullptr,
                       QObject* parent = nullptr, quint32 maxId = std::numeric_limits<quint32>::max());
    ~NotificationServer() override;

    // ═══════════════════════════════════════════════════════════════════════════
    // org.freedesktop.Notifications operations
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Create or replace a notification
     * @return The notification id, or nullopt when no id is free
     *
     * Content problems (bad encoding, unknown hints, odd action lists) never
     * fail the call; they are repaired or dropped.
     */
    std::optional<quint32> notify(const NotifyRequest& request);

    /**
     * @brief Post the server's own "started" notification if enabled in settings
     * @return Its id, or nullopt when disabled or refused
     */
    std::optional<quint32> announceStartup();

    /**
     * @brief Close a notification on behalf of the caller
     *
     * Emits notificationClosed(id, CallerClosed) if @p id was active;
     * an unknown id is a silent no-op.
     */
    Outcome closeNotification(quint32 id);

    /**
     * @brief Capabilities advertised through GetCapabilities, sorted
     */
    QStringList capabilities() const;

    ServerInformation serverInformation() const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Presenter-side events
    // ═══════════════════════════════════════════════════════════════════════════

    Outcome invokeAction(quint32 id, const QString& actionKey);
    Outcome dismiss(quint32 id);

    // ═══════════════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════════════

    std::optional<Notification> notification(quint32 id) const;
    QVector<Notification> activeNotifications() const;
    int activeCount() const;

    const NotificationStore& store() const
    {
        return m_store;
    }
    const ExpiryScheduler& scheduler() const
    {
        return *m_scheduler;
    }

    /**
     * @brief Cancel all timers and forget every notification without signals
     *
     * Used on shutdown; clients are not told since the bus name is going away.
     */
    void shutdown();

Q_SIGNALS:
    /**
     * @brief Forwarded to the NotificationClosed bus signal
     */
    void notificationClosed(quint32 id, uint reason);

    /**
     * @brief Forwarded to the ActionInvoked bus signal
     */
    void actionInvoked(quint32 id, const QString& actionKey);

private:
    Notification buildRecord(const NotifyRequest& request) const;
    DisplayRequest buildDisplayRequest(const Notification& record, bool replaced) const;
    void runCommands(const Notification& record);
    void recordHistory(const Notification& record);
    void enforceDisplayLimit(quint32 newestId);
    void onRemoved(const Notification& record, CloseReason reason);

    ISettings* m_settings;
    QPointer<INotificationPresenter> m_presenter;
    QPointer<NotificationHistory> m_history;

    NotificationStore m_store;
    std::unique_ptr<ExpiryScheduler> m_scheduler;
    std::unique_ptr<InteractionDispatcher> m_dispatcher;
};

} // namespace Herald
