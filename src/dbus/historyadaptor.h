// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>

namespace Herald {

class NotificationHistory;

/**
 * @brief D-Bus adaptor for the notification history log
 *
 * Provides D-Bus interface: org.herald.History
 *
 * Query results are JSON arrays of history entries, in the same shape as
 * the history file.
 */
class HERALD_EXPORT HistoryAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.herald.History")

public:
    explicit HistoryAdaptor(NotificationHistory* history, QObject* parent = nullptr);
    ~HistoryAdaptor() override = default;

public Q_SLOTS:
    /**
     * @brief Up to @p count entries, newest first
     */
    QString recent(int count);

    /**
     * @brief Every entry, oldest first
     */
    QString all();

    /**
     * @brief Case-insensitive search over app name, summary and body, newest first
     */
    QString search(const QString& query);

    bool clear();
    int count();
    QString path();

Q_SIGNALS:
    void entryAdded(uint id);
    void cleared();

private:
    NotificationHistory* m_history;
};

} // namespace Herald
