// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QDeadlineTimer>
#include <QHash>
#include <QObject>

class QTimer;

namespace Herald {

/**
 * @brief One-shot expiry timers for active notifications
 *
 * Each timer is tagged with the record revision it was armed for. A timer that
 * fires after its entry was cancelled or re-armed for a newer revision is
 * stale and is dropped. A timer that fires before its deadline (coarse timer
 * slack, clock adjustments) is re-armed for the remainder, so a notification
 * never expires early.
 *
 * Lives on the daemon's event loop thread.
 */
class HERALD_EXPORT ExpiryScheduler : public QObject
{
    Q_OBJECT

public:
    explicit ExpiryScheduler(QObject* parent = nullptr);
    ~ExpiryScheduler() override;

    /**
     * @brief Arm (or re-arm) the timer for @p id
     * @param timeoutMs Delay in milliseconds; values <= 0 only cancel
     */
    void schedule(quint32 id, quint64 revision, int timeoutMs);

    /**
     * @brief Disarm the timer for @p id (no-op if none)
     * @return true if a timer was pending
     */
    bool cancel(quint32 id);

    void cancelAll();

    bool isScheduled(quint32 id) const;

    /**
     * @brief Milliseconds until @p id expires, or -1 if not scheduled
     */
    qint64 remainingMs(quint32 id) const;

    int pendingCount() const;

Q_SIGNALS:
    /**
     * @brief The timer armed for (@p id, @p revision) ran out
     */
    void expired(quint32 id, quint64 revision);

private:
    struct Entry
    {
        QTimer* timer = nullptr;
        quint64 revision = 0;
        QDeadlineTimer deadline;
    };

    void onTimeout(quint32 id, QTimer* timer);
    void release(Entry& entry);

    QHash<quint32, Entry> m_entries;
};

} // namespace Herald
