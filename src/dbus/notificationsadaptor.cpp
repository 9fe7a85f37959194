// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationsadaptor.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/notificationserver.h"
#include <QDBusConnection>
#include <QDBusMessage>

namespace Herald {

NotificationsAdaptor::NotificationsAdaptor(NotificationServer* server, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_server(server)
{
    Q_ASSERT(server);

    connect(m_server, &NotificationServer::notificationClosed, this, &NotificationsAdaptor::NotificationClosed);
    connect(m_server, &NotificationServer::actionInvoked, this, &NotificationsAdaptor::ActionInvoked);
}

uint NotificationsAdaptor::Notify(const QString& app_name, uint replaces_id, const QString& app_icon,
                                  const QString& summary, const QString& body, const QStringList& actions,
                                  const QVariantMap& hints, int expire_timeout)
{
    NotifyRequest request;
    request.appName = app_name;
    request.replacesId = replaces_id;
    request.appIcon = app_icon;
    request.summary = summary;
    request.body = body;
    request.actions = actions;
    request.hints = hints;
    request.expireTimeout = expire_timeout;

    const auto id = m_server->notify(request);
    if (!id) {
        if (calledFromDBus()) {
            sendErrorReply(QString(DBus::Error::Exhausted),
                           QStringLiteral("No notification id is available; close some notifications first"));
        }
        return 0;
    }
    return *id;
}

void NotificationsAdaptor::CloseNotification(uint id)
{
    if (m_server->closeNotification(id) == Outcome::AlreadyGone) {
        qCDebug(lcDbus) << "CloseNotification for unknown id" << id;
    }
}

QStringList NotificationsAdaptor::GetCapabilities()
{
    return m_server->capabilities();
}

QString NotificationsAdaptor::GetServerInformation(QString& vendor, QString& version, QString& spec_version)
{
    const ServerInformation info = m_server->serverInformation();
    vendor = info.vendor;
    version = info.version;
    spec_version = info.specVersion;
    return info.name;
}

} // namespace Herald
