// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notificationhistory.h"
#include "logging.h"
#include "notification.h"
#include "textsanitizer.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTimeZone>
#include <algorithm>

namespace Herald {

// ═══════════════════════════════════════════════════════════════════════════════
// HistoryEntry
// ═══════════════════════════════════════════════════════════════════════════════

HistoryEntry HistoryEntry::fromNotification(const Notification& notification, const QDateTime& receivedAt)
{
    const QDateTime utc = receivedAt.toUTC();

    HistoryEntry entry;
    entry.id = notification.id;
    entry.appName = notification.appName;
    entry.summary = notification.summary;
    entry.body = notification.body;
    entry.urgency = urgencyToString(notification.hints.urgency);
    entry.timestamp = utc.toSecsSinceEpoch();
    entry.datetime = utc.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")) + QStringLiteral(" UTC");
    return entry;
}

QJsonObject HistoryEntry::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Id] = static_cast<qint64>(id);
    json[JsonKeys::AppName] = appName;
    json[JsonKeys::Summary] = summary;
    json[JsonKeys::Body] = body;
    json[JsonKeys::Urgency] = urgency;
    json[JsonKeys::Timestamp] = timestamp;
    json[JsonKeys::DateTime] = datetime;
    return json;
}

std::optional<HistoryEntry> HistoryEntry::fromJson(const QJsonObject& json)
{
    if (!json.contains(JsonKeys::Id) || !json.contains(JsonKeys::Timestamp)) {
        return std::nullopt;
    }

    HistoryEntry entry;
    entry.id = static_cast<quint32>(json[JsonKeys::Id].toInteger());
    entry.appName = json[JsonKeys::AppName].toString();
    entry.summary = json[JsonKeys::Summary].toString();
    entry.body = json[JsonKeys::Body].toString();
    entry.urgency = json[JsonKeys::Urgency].toString(QStringLiteral("normal"));
    entry.timestamp = json[JsonKeys::Timestamp].toInteger();
    entry.datetime = json[JsonKeys::DateTime].toString();
    if (entry.datetime.isEmpty()) {
        entry.datetime = QDateTime::fromSecsSinceEpoch(entry.timestamp, QTimeZone::utc())
                             .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
            + QStringLiteral(" UTC");
    }
    return entry;
}

bool HistoryEntry::matches(const QString& query) const
{
    return appName.contains(query, Qt::CaseInsensitive) || summary.contains(query, Qt::CaseInsensitive)
        || TextSanitizer::stripMarkup(body).contains(query, Qt::CaseInsensitive);
}

// ═══════════════════════════════════════════════════════════════════════════════
// NotificationHistory
// ═══════════════════════════════════════════════════════════════════════════════

NotificationHistory::NotificationHistory(const QString& filePath, int limit, QObject* parent)
    : QObject(parent)
    , m_path(filePath.isEmpty() ? defaultPath() : filePath)
    , m_limit(qMax(1, limit))
{
}

NotificationHistory::~NotificationHistory() = default;

QString NotificationHistory::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
        + QStringLiteral("/herald/history.json");
}

void NotificationHistory::setLimit(int limit)
{
    limit = qMax(1, limit);
    if (m_limit == limit) {
        return;
    }
    m_limit = limit;
    if (m_entries.size() > m_limit) {
        enforceLimit();
        save();
    }
}

bool NotificationHistory::load()
{
    m_entries.clear();

    QFile file(m_path);
    if (!file.exists()) {
        qCInfo(lcHistory) << "History file does not exist yet:" << m_path;
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcHistory) << "Failed to open history file:" << m_path << "Error:" << file.errorString();
        return false;
    }

    const QByteArray data = file.readAll();
    if (data.trimmed().isEmpty()) {
        return true;
    }

    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qCWarning(lcHistory) << "Failed to parse history file:" << m_path << "Error:" << parseError.errorString()
                             << "at offset" << parseError.offset;
        return false;
    }

    const QJsonArray array = doc.array();
    m_entries.reserve(array.size());
    for (const auto& value : array) {
        if (!value.isObject()) {
            qCWarning(lcHistory) << "Invalid history entry (not an object), skipping";
            continue;
        }
        if (const auto entry = HistoryEntry::fromJson(value.toObject())) {
            m_entries.append(*entry);
        } else {
            qCWarning(lcHistory) << "History entry without id or timestamp, skipping";
        }
    }
    enforceLimit();

    qCInfo(lcHistory) << "Loaded" << m_entries.size() << "history entries from" << m_path;
    return true;
}

bool NotificationHistory::add(const HistoryEntry& entry)
{
    m_entries.append(entry);
    enforceLimit();
    Q_EMIT entryAdded(entry.id);
    return save();
}

QVector<HistoryEntry> NotificationHistory::recent(int count) const
{
    QVector<HistoryEntry> result;
    if (count <= 0) {
        return result;
    }
    const qsizetype n = qMin<qsizetype>(count, m_entries.size());
    result.reserve(n);
    for (qsizetype i = m_entries.size() - 1; i >= m_entries.size() - n; --i) {
        result.append(m_entries.at(i));
    }
    return result;
}

QVector<HistoryEntry> NotificationHistory::all() const
{
    return m_entries;
}

QVector<HistoryEntry> NotificationHistory::search(const QString& query) const
{
    QVector<HistoryEntry> result;
    for (auto it = m_entries.crbegin(); it != m_entries.crend(); ++it) {
        if (it->matches(query)) {
            result.append(*it);
        }
    }
    return result;
}

bool NotificationHistory::clear()
{
    m_entries.clear();
    Q_EMIT cleared();
    return save();
}

QJsonArray NotificationHistory::toJsonArray(const QVector<HistoryEntry>& entries)
{
    QJsonArray array;
    for (const HistoryEntry& entry : entries) {
        array.append(entry.toJson());
    }
    return array;
}

bool NotificationHistory::save() const
{
    const QFileInfo info(m_path);
    QDir dir = info.absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcHistory) << "Failed to create history directory:" << dir.absolutePath();
        return false;
    }

    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcHistory) << "Failed to open history file for writing:" << m_path << "Error:" << file.errorString();
        return false;
    }

    const QByteArray data = QJsonDocument(toJsonArray(m_entries)).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qCWarning(lcHistory) << "Failed to write history file:" << m_path << "Error:" << file.errorString();
        return false;
    }

    if (!file.flush()) {
        qCWarning(lcHistory) << "Failed to flush history file:" << m_path << "Error:" << file.errorString();
        return false;
    }

    qCDebug(lcHistory) << "Saved" << m_entries.size() << "history entries to" << m_path;
    return true;
}

void NotificationHistory::enforceLimit()
{
    if (m_entries.size() > m_limit) {
        m_entries.remove(0, m_entries.size() - m_limit);
    }
}

} // namespace Herald
