// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "expiryscheduler.h"
#include "logging.h"

#include <QTimer>

namespace Herald {

ExpiryScheduler::ExpiryScheduler(QObject* parent)
    : QObject(parent)
{
}

ExpiryScheduler::~ExpiryScheduler()
{
    cancelAll();
}

void ExpiryScheduler::schedule(quint32 id, quint64 revision, int timeoutMs)
{
    cancel(id);
    if (timeoutMs <= 0) {
        return;
    }

    Entry entry;
    entry.revision = revision;
    entry.deadline = QDeadlineTimer(timeoutMs, Qt::PreciseTimer);
    entry.timer = new QTimer(this);
    entry.timer->setSingleShot(true);
    entry.timer->setTimerType(Qt::PreciseTimer);

    QTimer* timer = entry.timer;
    connect(timer, &QTimer::timeout, this, [this, id, timer]() {
        onTimeout(id, timer);
    });

    m_entries.insert(id, entry);
    timer->start(timeoutMs);
    qCDebug(lcExpiry) << "Scheduled expiry for" << id << "revision" << revision << "in" << timeoutMs << "ms";
}

bool ExpiryScheduler::cancel(quint32 id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    release(*it);
    m_entries.erase(it);
    qCDebug(lcExpiry) << "Cancelled expiry for" << id;
    return true;
}

void ExpiryScheduler::cancelAll()
{
    for (Entry& entry : m_entries) {
        release(entry);
    }
    m_entries.clear();
}

bool ExpiryScheduler::isScheduled(quint32 id) const
{
    return m_entries.contains(id);
}

qint64 ExpiryScheduler::remainingMs(quint32 id) const
{
    auto it = m_entries.constFind(id);
    if (it == m_entries.constEnd()) {
        return -1;
    }
    return it->deadline.remainingTime();
}

int ExpiryScheduler::pendingCount() const
{
    return static_cast<int>(m_entries.size());
}

void ExpiryScheduler::onTimeout(quint32 id, QTimer* timer)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->timer != timer) {
        // Cancelled or re-armed after this timer was queued
        qCDebug(lcExpiry) << "Dropping stale expiry for" << id;
        return;
    }

    const qint64 remaining = it->deadline.remainingTime();
    if (remaining > 0) {
        qCDebug(lcExpiry) << "Expiry for" << id << "fired" << remaining << "ms early, re-arming";
        timer->start(static_cast<int>(remaining));
        return;
    }

    const quint64 revision = it->revision;
    release(*it);
    m_entries.erase(it);

    qCDebug(lcExpiry) << "Notification" << id << "revision" << revision << "expired";
    Q_EMIT expired(id, revision);
}

void ExpiryScheduler::release(Entry& entry)
{
    if (entry.timer) {
        entry.timer->stop();
        entry.timer->deleteLater();
        entry.timer = nullptr;
    }
}

} // namespace Herald
