// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "notification.h"
#include "types.h"
#include <QObject>

namespace Herald {

class NotificationStore;

/**
 * @brief Turns user interaction and close requests into client signals
 *
 * Every close goes through here so that NotificationClosed is emitted exactly
 * once per notification: the store removal decides the winner, and a second
 * close of the same id observes AlreadyGone and emits nothing.
 *
 * Signal order for one close:
 *   1. removed(record, reason)       internal cleanup (timer, presenter view)
 *   2. notificationClosed(id, reason) forwarded to the bus
 */
class HERALD_EXPORT InteractionDispatcher : public QObject
{
    Q_OBJECT

public:
    explicit InteractionDispatcher(NotificationStore* store, QObject* parent = nullptr);
    ~InteractionDispatcher() override;

    /**
     * @brief The user activated an action
     *
     * Emits actionInvoked(), then closes the notification with Dismissed
     * unless it carries the resident hint. Keys the notification never
     * declared are dropped, except "default".
     */
    Outcome invokeAction(quint32 id, const QString& actionKey);

    /**
     * @brief The user dismissed the notification without choosing an action
     */
    Outcome dismiss(quint32 id);

    Outcome close(quint32 id, CloseReason reason);

    /**
     * @brief Close only if the record still carries @p revision
     */
    Outcome closeIfRevision(quint32 id, quint64 revision, CloseReason reason);

Q_SIGNALS:
    void actionInvoked(quint32 id, const QString& actionKey);
    void notificationClosed(quint32 id, Herald::CloseReason reason);
    void removed(const Herald::Notification& record, Herald::CloseReason reason);

private:
    void announceClosed(const Notification& record, CloseReason reason);

    NotificationStore* m_store;
};

} // namespace Herald
