// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QDBusAbstractAdaptor>
#include <QDBusContext>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace Herald {

class NotificationServer;

/**
 * @brief D-Bus adaptor for the freedesktop notification protocol
 *
 * Provides D-Bus interface: org.freedesktop.Notifications
 *
 * Thin facade over NotificationServer. Method names and argument order are
 * fixed by the Desktop Notifications Specification 1.2. Signature mismatches
 * never reach this class; QtDBus rejects them with InvalidArgs.
 */
class HERALD_EXPORT NotificationsAdaptor : public QDBusAbstractAdaptor, protected QDBusContext
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.freedesktop.Notifications")

public:
    explicit NotificationsAdaptor(NotificationServer* server, QObject* parent = nullptr);
    ~NotificationsAdaptor() override = default;

public Q_SLOTS:
    uint Notify(const QString& app_name, uint replaces_id, const QString& app_icon, const QString& summary,
                const QString& body, const QStringList& actions, const QVariantMap& hints, int expire_timeout);
    void CloseNotification(uint id);
    QStringList GetCapabilities();
    QString GetServerInformation(QString& vendor, QString& version, QString& spec_version);

Q_SIGNALS:
    void NotificationClosed(uint id, uint reason);
    void ActionInvoked(uint id, const QString& action_key);

private:
    NotificationServer* m_server;
};

} // namespace Herald
