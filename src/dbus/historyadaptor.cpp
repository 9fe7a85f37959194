// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "historyadaptor.h"
#include "../core/logging.h"
#include "../core/notificationhistory.h"
#include <QJsonDocument>

namespace Herald {

namespace {

QString toJsonString(const QVector<HistoryEntry>& entries)
{
    return QString::fromUtf8(QJsonDocument(NotificationHistory::toJsonArray(entries)).toJson(QJsonDocument::Compact));
}

} // anonymous namespace

HistoryAdaptor::HistoryAdaptor(NotificationHistory* history, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_history(history)
{
    Q_ASSERT(history);

    connect(m_history, &NotificationHistory::entryAdded, this, &HistoryAdaptor::entryAdded);
    connect(m_history, &NotificationHistory::cleared, this, &HistoryAdaptor::cleared);
}

QString HistoryAdaptor::recent(int count)
{
    if (count <= 0) {
        qCWarning(lcDbus) << "recent: count must be positive, got" << count;
        return QStringLiteral("[]");
    }
    return toJsonString(m_history->recent(count));
}

QString HistoryAdaptor::all()
{
    return toJsonString(m_history->all());
}

QString HistoryAdaptor::search(const QString& query)
{
    if (query.trimmed().isEmpty()) {
        qCWarning(lcDbus) << "search: empty query";
        return QStringLiteral("[]");
    }
    return toJsonString(m_history->search(query));
}

bool HistoryAdaptor::clear()
{
    qCInfo(lcDbus) << "Clearing notification history";
    return m_history->clear();
}

int HistoryAdaptor::count()
{
    return m_history->count();
}

QString HistoryAdaptor::path()
{
    return m_history->path();
}

} // namespace Herald
