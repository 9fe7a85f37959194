// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dbusvariantutils.h"
#include "logging.h"

#include <QDBusArgument>
#include <QDBusVariant>

namespace Herald {
namespace DBusVariantUtils {

QVariant convertDbusArgument(const QVariant& value)
{
    if (value.userType() == qMetaTypeId<QDBusVariant>()) {
        return convertDbusArgument(value.value<QDBusVariant>().variant());
    }

    // Handle QDBusArgument wrapper - extract to plain types first
    if (value.userType() == qMetaTypeId<QDBusArgument>()) {
        const QDBusArgument arg = value.value<QDBusArgument>();
        switch (arg.currentType()) {
        case QDBusArgument::MapType: {
            QVariantMap map;
            arg >> map;
            return convertDbusMap(map);
        }
        case QDBusArgument::ArrayType: {
            // ay is the common case (image-data pixels)
            if (arg.currentSignature() == QLatin1String("ay")) {
                QByteArray bytes;
                arg >> bytes;
                return bytes;
            }
            QVariantList list;
            arg >> list;
            QVariantList result;
            result.reserve(list.size());
            for (const QVariant& item : list) {
                result.append(convertDbusArgument(item));
            }
            return result;
        }
        case QDBusArgument::StructureType: {
            // image-data is a (iiibiiay) structure
            QVariantList structData;
            arg.beginStructure();
            while (!arg.atEnd()) {
                structData.append(convertDbusArgument(arg.asVariant()));
            }
            arg.endStructure();
            return structData;
        }
        case QDBusArgument::BasicType:
        case QDBusArgument::VariantType: {
            QVariant extracted;
            arg >> extracted;
            return convertDbusArgument(extracted);
        }
        default:
            qCWarning(lcDbus) << "Unhandled QDBusArgument type:" << arg.currentType();
            return value;
        }
    }

    if (value.typeId() == QMetaType::QVariantList) {
        const QVariantList list = value.toList();
        QVariantList result;
        result.reserve(list.size());
        for (const QVariant& item : list) {
            result.append(convertDbusArgument(item));
        }
        return result;
    }

    if (value.typeId() == QMetaType::QVariantMap) {
        return convertDbusMap(value.toMap());
    }

    // Plain types pass through unchanged
    return value;
}

QVariantMap convertDbusMap(const QVariantMap& map)
{
    QVariantMap result;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
        result.insert(it.key(), convertDbusArgument(it.value()));
    }
    return result;
}

std::optional<qint64> toInteger(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::UChar:
    case QMetaType::Char:
    case QMetaType::SChar:
    case QMetaType::Short:
    case QMetaType::UShort:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::LongLong:
    case QMetaType::ULong:
    case QMetaType::ULongLong:
        return value.toLongLong();
    case QMetaType::QString: {
        bool ok = false;
        const qint64 parsed = value.toString().trimmed().toLongLong(&ok);
        if (ok) {
            return parsed;
        }
        return std::nullopt;
    }
    default:
        return std::nullopt;
    }
}

std::optional<bool> toBoolean(const QVariant& value)
{
    if (value.typeId() == QMetaType::Bool) {
        return value.toBool();
    }
    if (value.typeId() == QMetaType::QString) {
        const QString text = value.toString().trimmed().toLower();
        if (text == QLatin1String("true")) {
            return true;
        }
        if (text == QLatin1String("false")) {
            return false;
        }
    }
    if (const auto number = toInteger(value)) {
        return *number != 0;
    }
    return std::nullopt;
}

} // namespace DBusVariantUtils
} // namespace Herald
