// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QVariant>
#include <QVariantMap>
#include <optional>

namespace Herald {

/**
 * @brief D-Bus variant conversion utilities
 *
 * Notify hints arrive as a{sv}. Basic values come through as plain QVariants,
 * but structured ones (image-data, arrays) stay wrapped in a read-only
 * QDBusArgument, and some clients double-wrap values in a QDBusVariant.
 * qdbus_cast won't help here - it only handles top-level types.
 */
namespace DBusVariantUtils {

/**
 * @brief Recursively convert QDBusArgument values to plain QVariant types
 * @param value The QVariant that may contain QDBusArgument wrappers
 * @return A QVariant with all QDBusArgument wrappers converted to plain types
 *
 * Handles:
 * - QDBusVariant → inner value, recursively converted
 * - QDBusArgument MapType → QVariantMap
 * - QDBusArgument ArrayType → QVariantList (byte arrays stay QByteArray)
 * - QDBusArgument StructureType → QVariantList
 * - QDBusArgument BasicType/VariantType → extracted value
 * - Nested QVariantList/QVariantMap → recursively converted
 * - Plain types → passed through unchanged
 */
HERALD_EXPORT QVariant convertDbusArgument(const QVariant& value);

/**
 * @brief Convert every value of an a{sv} map with convertDbusArgument()
 */
HERALD_EXPORT QVariantMap convertDbusMap(const QVariantMap& map);

/**
 * @brief Read an integer hint sent as byte, int, uint or a digit string
 * @return The value, or nullopt if @p value is not an integer
 */
HERALD_EXPORT std::optional<qint64> toInteger(const QVariant& value);

/**
 * @brief Read a boolean hint sent as bool, an integer, or "true"/"false"
 * @return The value, or nullopt if @p value is not a boolean
 */
HERALD_EXPORT std::optional<bool> toBoolean(const QVariant& value);

} // namespace DBusVariantUtils

} // namespace Herald
