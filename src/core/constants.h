// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace Herald {

/**
 * @brief Default values for core module constants
 *
 * These defaults are used by core module files that can't depend on config.
 * For user-configurable settings, see ConfigDefaults and herald.kcfg.
 */
namespace Defaults {
// Per-urgency expiry used when a client passes expire_timeout = -1 (0 = never expire)
constexpr int LowTimeoutMs = 5000;
constexpr int NormalTimeoutMs = 10000;
constexpr int CriticalTimeoutMs = 0;

// Text limits in UTF-16 code units (0 = unlimited)
constexpr int MaxSummaryLength = 512;
constexpr int MaxBodyLength = 16384;

// Active notification cap (0 = unlimited)
constexpr int DisplayLimit = 0;

// History ring buffer size
constexpr int HistoryLimit = 10000;
}

/**
 * @brief Notification protocol constants (freedesktop.org Desktop Notifications 1.2)
 */
namespace Protocol {
inline constexpr QLatin1String SpecVersion{"1.2"};
inline constexpr QLatin1String ServerName{"Herald"};
inline constexpr QLatin1String ServerVendor{"Herald"};

// Action key activated by clicking the notification body
inline constexpr QLatin1String DefaultActionKey{"default"};

namespace Hint {
inline constexpr QLatin1String Urgency{"urgency"};
inline constexpr QLatin1String Resident{"resident"};
inline constexpr QLatin1String Transient{"transient"};
inline constexpr QLatin1String Category{"category"};
inline constexpr QLatin1String DesktopEntry{"desktop-entry"};
inline constexpr QLatin1String ImagePath{"image-path"};
inline constexpr QLatin1String ImagePathLegacy{"image_path"};
inline constexpr QLatin1String SoundFile{"sound-file"};
inline constexpr QLatin1String SuppressSound{"suppress-sound"};
}

namespace Capability {
inline constexpr QLatin1String ActionIcons{"action-icons"};
inline constexpr QLatin1String Actions{"actions"};
inline constexpr QLatin1String Body{"body"};
inline constexpr QLatin1String BodyHyperlinks{"body-hyperlinks"};
inline constexpr QLatin1String BodyImages{"body-images"};
inline constexpr QLatin1String BodyMarkup{"body-markup"};
inline constexpr QLatin1String IconStatic{"icon-static"};
inline constexpr QLatin1String Persistence{"persistence"};
inline constexpr QLatin1String Sound{"sound"};
}
}

/**
 * @brief JSON keys for history serialization
 */
namespace JsonKeys {
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String AppName{"app_name"};
inline constexpr QLatin1String Summary{"summary"};
inline constexpr QLatin1String Body{"body"};
inline constexpr QLatin1String Urgency{"urgency"};
inline constexpr QLatin1String Timestamp{"timestamp"};
inline constexpr QLatin1String DateTime{"datetime"};
}

/**
 * @brief D-Bus service constants
 */
namespace DBus {
inline constexpr QLatin1String ServiceName{"org.freedesktop.Notifications"};
inline constexpr QLatin1String ObjectPath{"/org/freedesktop/Notifications"};

namespace Error {
inline constexpr QLatin1String Exhausted{"org.freedesktop.Notifications.Error.Exhausted"};
}
}

} // namespace Herald
