// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace Herald {

class Settings;
class NotificationHistory;
class NotificationServer;
class BusPresenter;
class NotificationsAdaptor;
class HistoryAdaptor;
class PresenterAdaptor;

/**
 * @brief Main daemon for Herald
 *
 * The daemon runs in the background and handles:
 * - The org.freedesktop.Notifications service on the session bus
 * - Notification lifecycle through NotificationServer
 * - The persistent history log
 * - Forwarding display requests to an external renderer
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    // No singleton - use dependency injection instead

    /**
     * @brief Register the bus name and object
     * @param replace Take the name over from a running notification server
     * @return false if the name or object could not be registered
     */
    bool init(bool replace = false);
    void start();
    void stop();

    /**
     * @brief Re-read heraldrc (SIGHUP)
     */
    void reloadSettings();

    // Component access
    Settings* settings() const
    {
        return m_settings.get();
    }
    NotificationServer* server() const
    {
        return m_server.get();
    }
    NotificationHistory* history() const
    {
        return m_history.get();
    }

Q_SIGNALS:
    /**
     * @brief Another server took org.freedesktop.Notifications from us
     */
    void serviceLost();

private Q_SLOTS:
    void onNameLost(const QString& name);

private:
    bool registerService(bool replace);

    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<NotificationHistory> m_history;
    std::unique_ptr<BusPresenter> m_presenter;
    std::unique_ptr<NotificationServer> m_server;

    // D-Bus adaptors (owned by this via Qt parent)
    NotificationsAdaptor* m_notificationsAdaptor = nullptr;
    HistoryAdaptor* m_historyAdaptor = nullptr;
    PresenterAdaptor* m_presenterAdaptor = nullptr;

    bool m_running = false;
    bool m_registered = false;
};

} // namespace Herald
