// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interactiondispatcher.h"
#include "constants.h"
#include "logging.h"
#include "notificationstore.h"

namespace Herald {

InteractionDispatcher::InteractionDispatcher(NotificationStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    Q_ASSERT(m_store);
}

InteractionDispatcher::~InteractionDispatcher() = default;

Outcome InteractionDispatcher::invokeAction(quint32 id, const QString& actionKey)
{
    const auto record = m_store->get(id);
    if (!record) {
        qCDebug(lcCore) << "Action" << actionKey << "for closed notification" << id << "dropped";
        return Outcome::AlreadyGone;
    }

    if (actionKey != Protocol::DefaultActionKey && !record->hasAction(actionKey)) {
        qCWarning(lcCore) << "Notification" << id << "has no action" << actionKey;
        return Outcome::AlreadyGone;
    }

    qCInfo(lcCore) << "Action" << actionKey << "invoked on notification" << id;
    Q_EMIT actionInvoked(id, actionKey);

    if (record->hints.resident) {
        return Outcome::Applied;
    }

    // A concurrent close may have won in between; that is still a successful invoke
    close(id, CloseReason::Dismissed);
    return Outcome::Applied;
}

Outcome InteractionDispatcher::dismiss(quint32 id)
{
    return close(id, CloseReason::Dismissed);
}

Outcome InteractionDispatcher::close(quint32 id, CloseReason reason)
{
    Notification record;
    if (m_store->remove(id, &record) == Outcome::AlreadyGone) {
        qCDebug(lcCore) << "Close of notification" << id << "ignored, already gone";
        return Outcome::AlreadyGone;
    }
    announceClosed(record, reason);
    return Outcome::Applied;
}

Outcome InteractionDispatcher::closeIfRevision(quint32 id, quint64 revision, CloseReason reason)
{
    Notification record;
    if (m_store->removeIfRevision(id, revision, &record) == Outcome::AlreadyGone) {
        qCDebug(lcCore) << "Close of notification" << id << "revision" << revision << "ignored, superseded";
        return Outcome::AlreadyGone;
    }
    announceClosed(record, reason);
    return Outcome::Applied;
}

void InteractionDispatcher::announceClosed(const Notification& record, CloseReason reason)
{
    qCInfo(lcCore) << "Notification" << record.id << "closed:" << closeReasonToString(reason);
    Q_EMIT removed(record, reason);
    Q_EMIT notificationClosed(record.id, reason);
}

} // namespace Herald
