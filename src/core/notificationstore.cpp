// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationstore.h"
#include "logging.h"

#include <QMutexLocker>
#include <algorithm>

namespace Herald {

NotificationStore::NotificationStore(quint32 maxId)
    : m_allocator(maxId)
{
}

std::optional<NotificationStore::InsertResult> NotificationStore::insertOrReplace(const Notification& record,
                                                                                   quint32 replacesId)
{
    QMutexLocker locker(&m_mutex);

    const QDateTime now = QDateTime::currentDateTimeUtc();

    if (replacesId != 0) {
        auto it = m_records.find(replacesId);
        if (it != m_records.end()) {
            Notification updated = record;
            updated.id = replacesId;
            updated.sequence = it->sequence;
            updated.createdAt = it->createdAt;
            updated.updatedAt = now;
            updated.revision = it->revision + 1;
            *it = updated;
            qCDebug(lcStore) << "Replaced notification" << replacesId << "revision" << updated.revision;
            return InsertResult{updated, true};
        }
        qCDebug(lcStore) << "replaces_id" << replacesId << "is not active, allocating a fresh id";
    }

    const auto id = m_allocator.allocate(
        [this](quint32 candidate) {
            return m_records.contains(candidate);
        },
        static_cast<quint64>(m_records.size()));
    if (!id) {
        return std::nullopt;
    }

    Notification inserted = record;
    inserted.id = *id;
    inserted.sequence = m_nextSequence++;
    inserted.createdAt = now;
    inserted.updatedAt = now;
    inserted.revision = 1;
    m_records.insert(*id, inserted);
    qCDebug(lcStore) << "Inserted notification" << *id << "active:" << m_records.size();
    return InsertResult{inserted, false};
}

std::optional<Notification> NotificationStore::get(quint32 id) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.constFind(id);
    if (it == m_records.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

bool NotificationStore::contains(quint32 id) const
{
    QMutexLocker locker(&m_mutex);
    return m_records.contains(id);
}

Outcome NotificationStore::remove(quint32 id, Notification* removed)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return Outcome::AlreadyGone;
    }
    if (removed) {
        *removed = *it;
    }
    m_records.erase(it);
    return Outcome::Applied;
}

Outcome NotificationStore::removeIfRevision(quint32 id, quint64 revision, Notification* removed)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return Outcome::AlreadyGone;
    }
    if (it->revision != revision) {
        qCDebug(lcStore) << "Notification" << id << "is at revision" << it->revision << "not" << revision;
        return Outcome::AlreadyGone;
    }
    if (removed) {
        *removed = *it;
    }
    m_records.erase(it);
    return Outcome::Applied;
}

QVector<Notification> NotificationStore::snapshot() const
{
    QVector<Notification> records;
    {
        QMutexLocker locker(&m_mutex);
        records.reserve(m_records.size());
        for (const Notification& record : m_records) {
            records.append(record);
        }
    }
    std::sort(records.begin(), records.end(), [](const Notification& a, const Notification& b) {
        return a.sequence < b.sequence;
    });
    return records;
}

std::optional<Notification> NotificationStore::oldest(quint32 excludeId) const
{
    QMutexLocker locker(&m_mutex);
    const Notification* best = nullptr;
    for (const Notification& record : m_records) {
        if (record.id == excludeId) {
            continue;
        }
        if (!best || record.sequence < best->sequence) {
            best = &record;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

int NotificationStore::count() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_records.size());
}

QVector<quint32> NotificationStore::ids() const
{
    QMutexLocker locker(&m_mutex);
    QVector<quint32> result = m_records.keys();
    std::sort(result.begin(), result.end());
    return result;
}

void NotificationStore::clear()
{
    QMutexLocker locker(&m_mutex);
    m_records.clear();
    m_allocator.reset();
    m_nextSequence = 1;
}

} // namespace Herald
