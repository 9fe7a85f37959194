// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "constants.h"
#include "types.h"
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QVector>
#include <optional>

namespace Herald {

struct Notification;

/**
 * @brief One notification as recorded in the history file
 */
struct HERALD_EXPORT HistoryEntry
{
    quint32 id = 0;
    QString appName;
    QString summary;
    QString body;
    QString urgency; ///< "low", "normal" or "critical"
    qint64 timestamp = 0; ///< Unix seconds
    QString datetime; ///< "yyyy-MM-dd HH:mm:ss UTC"

    static HistoryEntry fromNotification(const Notification& notification, const QDateTime& receivedAt);

    QJsonObject toJson() const;

    /**
     * @return The entry, or nullopt if @p json lacks an id or timestamp
     */
    static std::optional<HistoryEntry> fromJson(const QJsonObject& json);

    /**
     * @brief Case-insensitive match of @p query against app name, summary and body
     */
    bool matches(const QString& query) const;
};

/**
 * @brief Persistent log of received notifications
 *
 * Ring buffer of at most limit() entries kept in memory and mirrored to a
 * JSON array on disk. The oldest entries are evicted first. Nothing else
 * about a notification survives a daemon restart.
 */
class HERALD_EXPORT NotificationHistory : public QObject
{
    Q_OBJECT

public:
    /**
     * @param filePath History file; empty selects defaultPath()
     */
    explicit NotificationHistory(const QString& filePath = QString(), int limit = Defaults::HistoryLimit,
                                 QObject* parent = nullptr);
    ~NotificationHistory() override;

    /**
     * @brief $XDG_DATA_HOME/herald/history.json
     */
    static QString defaultPath();

    QString path() const
    {
        return m_path;
    }

    int limit() const
    {
        return m_limit;
    }
    void setLimit(int limit);

    int count() const
    {
        return static_cast<int>(m_entries.size());
    }

    /**
     * @brief Read the history file, replacing the in-memory entries
     * @return false if the file exists but could not be read or parsed
     */
    bool load();

    /**
     * @brief Append an entry, evict beyond the limit and write the file
     * @return false if the file could not be written (the entry is kept in memory)
     */
    bool add(const HistoryEntry& entry);

    /**
     * @brief Up to @p count entries, newest first
     */
    QVector<HistoryEntry> recent(int count) const;

    /**
     * @brief All entries, oldest first
     */
    QVector<HistoryEntry> all() const;

    /**
     * @brief Entries matching @p query, newest first
     */
    QVector<HistoryEntry> search(const QString& query) const;

    /**
     * @brief Drop every entry and write the empty file
     */
    bool clear();

    static QJsonArray toJsonArray(const QVector<HistoryEntry>& entries);

Q_SIGNALS:
    void entryAdded(quint32 id);
    void cleared();

private:
    bool save() const;
    void enforceLimit();

    QString m_path;
    int m_limit;
    QVector<HistoryEntry> m_entries;
};

} // namespace Herald
