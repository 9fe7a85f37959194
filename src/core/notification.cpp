// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notification.h"
#include "constants.h"
#include "dbusvariantutils.h"
#include "logging.h"
#include "textsanitizer.h"

#include <QSet>

namespace Herald {

namespace {

std::optional<Urgency> parseUrgency(const QVariant& value)
{
    if (value.typeId() == QMetaType::QString) {
        if (const auto urgency = urgencyFromString(value.toString())) {
            return urgency;
        }
    }

    const auto level = DBusVariantUtils::toInteger(value);
    if (!level || *level < static_cast<int>(Urgency::Low) || *level > static_cast<int>(Urgency::Critical)) {
        return std::nullopt;
    }
    return static_cast<Urgency>(*level);
}

QString readString(const QVariant& value, QLatin1String hint)
{
    // Some clients send paths as ay; decode those instead of dropping them
    if (value.typeId() == QMetaType::QByteArray) {
        QByteArray bytes = value.toByteArray();
        while (bytes.endsWith('\0')) {
            bytes.chop(1);
        }
        return TextSanitizer::sanitizeText(TextSanitizer::fromUtf8Lossy(bytes));
    }
    if (value.typeId() != QMetaType::QString) {
        qCDebug(lcCore) << "Dropping hint" << hint << "with non-string value" << value;
        return QString();
    }
    return TextSanitizer::sanitizeText(value.toString());
}

bool readBool(const QVariant& value, QLatin1String hint)
{
    const auto flag = DBusVariantUtils::toBoolean(value);
    if (!flag) {
        qCDebug(lcCore) << "Dropping hint" << hint << "with non-boolean value" << value;
        return false;
    }
    return *flag;
}

} // anonymous namespace

NotificationHints NotificationHints::fromVariantMap(const QVariantMap& hints)
{
    namespace Hint = Protocol::Hint;

    NotificationHints result;
    const QVariantMap plain = DBusVariantUtils::convertDbusMap(hints);

    for (auto it = plain.constBegin(); it != plain.constEnd(); ++it) {
        const QString& key = it.key();
        const QVariant& value = it.value();

        if (key == Hint::Urgency) {
            if (const auto urgency = parseUrgency(value)) {
                result.urgency = *urgency;
            } else {
                qCDebug(lcCore) << "Invalid urgency hint" << value << "- using normal";
            }
        } else if (key == Hint::Resident) {
            result.resident = readBool(value, Hint::Resident);
        } else if (key == Hint::Transient) {
            result.transient = readBool(value, Hint::Transient);
        } else if (key == Hint::SuppressSound) {
            result.suppressSound = readBool(value, Hint::SuppressSound);
        } else if (key == Hint::Category) {
            result.category = readString(value, Hint::Category);
        } else if (key == Hint::DesktopEntry) {
            result.desktopEntry = readString(value, Hint::DesktopEntry);
        } else if (key == Hint::ImagePath || key == Hint::ImagePathLegacy) {
            // image-path takes precedence over the deprecated image_path
            if (result.imagePath.isEmpty() || key == Hint::ImagePath) {
                result.imagePath = readString(value, Hint::ImagePath);
            }
        } else if (key == Hint::SoundFile) {
            result.soundFile = readString(value, Hint::SoundFile);
        } else {
            result.extra.insert(key, value);
        }
    }

    return result;
}

QVariantMap NotificationHints::toVariantMap() const
{
    namespace Hint = Protocol::Hint;

    QVariantMap map = extra;
    map.insert(Hint::Urgency, static_cast<int>(urgency));
    map.insert(Hint::Resident, resident);
    map.insert(Hint::Transient, transient);
    if (suppressSound) {
        map.insert(Hint::SuppressSound, true);
    }
    if (!category.isEmpty()) {
        map.insert(Hint::Category, category);
    }
    if (!desktopEntry.isEmpty()) {
        map.insert(Hint::DesktopEntry, desktopEntry);
    }
    if (!imagePath.isEmpty()) {
        map.insert(Hint::ImagePath, imagePath);
    }
    if (!soundFile.isEmpty()) {
        map.insert(Hint::SoundFile, soundFile);
    }
    return map;
}

bool Notification::hasAction(const QString& key) const
{
    for (const NotificationAction& action : actions) {
        if (action.key == key) {
            return true;
        }
    }
    return false;
}

NotificationActions parseActions(const QStringList& flat)
{
    if (flat.size() % 2 != 0) {
        qCWarning(lcCore) << "Actions list has odd length, dropping trailing key" << flat.last();
    }

    NotificationActions actions;
    actions.reserve(flat.size() / 2);
    QSet<QString> seen;
    for (qsizetype i = 0; i + 1 < flat.size(); i += 2) {
        const QString key = TextSanitizer::sanitizeText(flat.at(i));
        if (key.isEmpty() || seen.contains(key)) {
            qCDebug(lcCore) << "Dropping empty or duplicate action key" << key;
            continue;
        }
        seen.insert(key);
        actions.append({key, TextSanitizer::sanitizeSummary(flat.at(i + 1))});
    }
    return actions;
}

} // namespace Herald
