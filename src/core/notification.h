// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include "types.h"
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVariantMap>

namespace Herald {

/**
 * @brief Hints recognized by the server, parsed from the Notify a{sv} map
 *
 * Unknown hints are kept in @c extra and forwarded to the presenter untouched.
 * Known hints with the wrong type are coerced where possible, otherwise dropped.
 */
struct HERALD_EXPORT NotificationHints
{
    Urgency urgency = Urgency::Normal;
    bool resident = false;
    bool transient = false;
    bool suppressSound = false;
    QString category;
    QString desktopEntry;
    QString imagePath;
    QString soundFile;
    QVariantMap extra;

    /**
     * @brief Parse a hints map received over D-Bus
     * @param hints Raw hints, may contain QDBusArgument/QDBusVariant wrappers
     */
    static NotificationHints fromVariantMap(const QVariantMap& hints);

    /**
     * @brief Flatten back into a plain map for the presenter
     */
    QVariantMap toVariantMap() const;
};

/**
 * @brief One active notification
 *
 * Plain value type. Records are copied out of NotificationStore, never shared.
 */
struct HERALD_EXPORT Notification
{
    quint32 id = 0;
    QString appName;
    QString appIcon;
    QString summary;
    QString body;
    NotificationActions actions;
    NotificationHints hints;

    // As requested by the caller (-1 = server default, 0 = never)
    int expireTimeoutMs = -1;
    // Resolved from expireTimeoutMs and the per-urgency defaults (0 = never)
    int effectiveTimeoutMs = 0;

    QDateTime createdAt;
    QDateTime updatedAt;

    quint64 revision = 0;
    quint64 sequence = 0;

    bool hasAction(const QString& key) const;
};

/**
 * @brief Pair a flat [key, label, key, label, ...] list into actions
 *
 * Order is preserved. A trailing key without a label is dropped, as is a
 * repeated key (the first occurrence wins).
 */
HERALD_EXPORT NotificationActions parseActions(const QStringList& flat);

} // namespace Herald

Q_DECLARE_METATYPE(Herald::Notification)
