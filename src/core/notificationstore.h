// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "idallocator.h"
#include "notification.h"
#include <QHash>
#include <QMutex>
#include <QVector>
#include <optional>

namespace Herald {

/**
 * @brief Authoritative set of active notifications, keyed by id
 *
 * Thread-safe. Every method takes the internal mutex, and records are copied
 * in and out, so a reader never observes a half-updated record. Id allocation
 * happens under the same lock as the insertion, which makes concurrent
 * insertOrReplace() calls safe without any outer locking.
 */
class HERALD_EXPORT NotificationStore
{
public:
    explicit NotificationStore(quint32 maxId = std::numeric_limits<quint32>::max());

    NotificationStore(const NotificationStore&) = delete;
    NotificationStore& operator=(const NotificationStore&) = delete;

    /**
     * @brief Result of insertOrReplace()
     */
    struct InsertResult
    {
        Notification record; ///< The record as stored (id, revision, timestamps filled in)
        bool replaced = false; ///< True if an active record was overwritten in place
    };

    /**
     * @brief Store a new record or overwrite an active one
     * @param record Content to store; id, revision, sequence and timestamps are ignored
     * @param replacesId Id to overwrite, or 0. An id that is not active gets a fresh id.
     * @return The stored record, or nullopt when the identifier space is exhausted
     *
     * A replaced record keeps its id, sequence and createdAt; its revision is bumped.
     */
    std::optional<InsertResult> insertOrReplace(const Notification& record, quint32 replacesId = 0);

    std::optional<Notification> get(quint32 id) const;
    bool contains(quint32 id) const;

    /**
     * @brief Remove a record
     * @param removed If non-null and the record existed, receives the removed record
     */
    Outcome remove(quint32 id, Notification* removed = nullptr);

    /**
     * @brief Remove a record only if it still carries @p revision
     *
     * Used by expiry: a timer armed before a replace must not close the
     * replaced content.
     */
    Outcome removeIfRevision(quint32 id, quint64 revision, Notification* removed = nullptr);

    /**
     * @brief All active records ordered by creation
     */
    QVector<Notification> snapshot() const;

    /**
     * @brief Oldest active record, optionally skipping one id
     */
    std::optional<Notification> oldest(quint32 excludeId = 0) const;

    int count() const;
    QVector<quint32> ids() const;

    /**
     * @brief Drop all records and restart id allocation at 1
     */
    void clear();

private:
    mutable QMutex m_mutex;
    QHash<quint32, Notification> m_records;
    IdAllocator m_allocator;
    quint64 m_nextSequence = 1;
};

} // namespace Herald
