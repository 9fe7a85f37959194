// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"
#include "buspresenter.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/notificationhistory.h"
#include "../core/notificationserver.h"
#include "../dbus/historyadaptor.h"
#include "../dbus/notificationsadaptor.h"
#include "../dbus/presenteradaptor.h"

#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusError>
#include <QDBusReply>
#include <QThread>

namespace Herald {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    // Don't pass 'this' as parent for unique_ptr-managed objects.
    // unique_ptr owns lifetime; a Qt parent would double-free.
    , m_settings(std::make_unique<Settings>(nullptr))
    , m_history(std::make_unique<NotificationHistory>(QString(), m_settings->historyLimit(), nullptr))
    , m_presenter(std::make_unique<BusPresenter>(m_settings.get(), nullptr))
    , m_server(std::make_unique<NotificationServer>(m_settings.get(), m_presenter.get(), m_history.get(), nullptr))
{
}

Daemon::~Daemon()
{
    stop();
}

bool Daemon::init(bool replace)
{
    if (!m_history->load()) {
        // A corrupt file must not block notifications; the next add() rewrites it
        qCWarning(lcDaemon) << "Starting with empty history, could not read" << m_history->path();
    }

    // Create D-Bus adaptors (they're owned by this via Qt parent)
    m_notificationsAdaptor = new NotificationsAdaptor(m_server.get(), this);
    m_historyAdaptor = new HistoryAdaptor(m_history.get(), this);
    m_presenterAdaptor = new PresenterAdaptor(m_presenter.get(), this);

    if (!registerService(replace)) {
        return false;
    }

    QDBusConnection bus = QDBusConnection::sessionBus();

    // Register D-Bus object (no retry needed - service is already registered)
    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        QDBusError error = bus.lastError();
        qCCritical(lcDaemon) << "Failed to register D-Bus object:" << DBus::ObjectPath << "Error:" << error.message();
        // Cleanup: unregister service if object registration fails
        bus.unregisterService(QString(DBus::ServiceName));
        m_registered = false;
        return false;
    }

    // Lose the name when another server starts with --replace
    bus.connect(QStringLiteral("org.freedesktop.DBus"), QStringLiteral("/org/freedesktop/DBus"),
                QStringLiteral("org.freedesktop.DBus"), QStringLiteral("NameLost"), this, SLOT(onNameLost(QString)));

    qCInfo(lcDaemon) << "D-Bus service registered service= " << DBus::ServiceName << " path= " << DBus::ObjectPath;
    return true;
}

bool Daemon::registerService(bool replace)
{
    QDBusConnection bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "Cannot connect to the session bus:" << bus.lastError().message();
        return false;
    }

    QDBusConnectionInterface* busInterface = bus.interface();
    const auto queueOption =
        replace ? QDBusConnectionInterface::ReplaceExistingService : QDBusConnectionInterface::DontQueueService;

    // Retry D-Bus service registration (with linear backoff)
    const int maxRetries = 3;
    for (int attempt = 0; attempt < maxRetries; ++attempt) {
        const QDBusReply<QDBusConnectionInterface::RegisterServiceReply> reply = busInterface->registerService(
            QString(DBus::ServiceName), queueOption, QDBusConnectionInterface::AllowReplacement);

        if (reply.isValid() && reply.value() == QDBusConnectionInterface::ServiceRegistered) {
            m_registered = true;
            return true;
        }

        if (reply.isValid()) {
            // Name is owned by another server and we were not asked to replace it
            qCCritical(lcDaemon) << DBus::ServiceName << "is already owned by another notification server;"
                                 << "use --replace to take over";
            return false;
        }

        const QDBusError error = reply.error();
        if (error.type() == QDBusError::ServiceUnknown || error.type() == QDBusError::NoReply) {
            // Transient error - retry
            if (attempt < maxRetries - 1) {
                int delayMs = 1000 * (attempt + 1); // Linear backoff: 1s, 2s, 3s
                qCWarning(lcDaemon) << "Failed to register D-Bus service (attempt" << (attempt + 1) << "/"
                                    << maxRetries << "):" << error.message() << "- retrying in" << delayMs << "ms";
                QThread::msleep(delayMs);
                continue;
            }
        }

        // Non-retryable error or max retries reached
        qCCritical(lcDaemon) << "Failed to register D-Bus service:" << DBus::ServiceName
                             << "Error:" << error.message() << "Type:" << error.type();
        return false;
    }

    qCCritical(lcDaemon) << "Failed to register D-Bus service after" << maxRetries << "attempts";
    return false;
}

void Daemon::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    qCInfo(lcDaemon) << "Serving notifications, history entries:" << m_history->count();

    if (const auto id = m_server->announceStartup()) {
        qCDebug(lcDaemon) << "Startup notification posted as" << *id;
    }
}

void Daemon::stop()
{
    if (!m_running && !m_registered) {
        return;
    }

    // Stop pending timers to prevent callbacks during shutdown
    m_server->shutdown();

    // Unregister D-Bus service to prevent late calls during shutdown
    if (m_registered) {
        QDBusConnection bus = QDBusConnection::sessionBus();
        bus.unregisterObject(QString(DBus::ObjectPath));
        bus.unregisterService(QString(DBus::ServiceName));
        m_registered = false;
    }

    m_running = false;
}

void Daemon::reloadSettings()
{
    qCInfo(lcDaemon) << "Reloading settings";
    m_settings->load();
}

void Daemon::onNameLost(const QString& name)
{
    if (name != DBus::ServiceName) {
        return;
    }
    qCInfo(lcDaemon) << "Lost" << name << "to another notification server, shutting down";
    QDBusConnection::sessionBus().unregisterObject(QString(DBus::ObjectPath));
    m_registered = false;
    Q_EMIT serviceLost();
}

} // namespace Herald
