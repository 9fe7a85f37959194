// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace Herald {

QString urgencyToString(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low:
        return QStringLiteral("low");
    case Urgency::Normal:
        return QStringLiteral("normal");
    case Urgency::Critical:
        return QStringLiteral("critical");
    }
    return QStringLiteral("normal");
}

std::optional<Urgency> urgencyFromString(const QString& name)
{
    const QString text = name.trimmed().toLower();
    if (text == QLatin1String("low")) {
        return Urgency::Low;
    }
    if (text == QLatin1String("normal")) {
        return Urgency::Normal;
    }
    if (text == QLatin1String("critical")) {
        return Urgency::Critical;
    }
    return std::nullopt;
}

QString closeReasonToString(CloseReason reason)
{
    switch (reason) {
    case CloseReason::Expired:
        return QStringLiteral("expired");
    case CloseReason::Dismissed:
        return QStringLiteral("dismissed");
    case CloseReason::CallerClosed:
        return QStringLiteral("caller-closed");
    case CloseReason::Undefined:
        return QStringLiteral("undefined");
    }
    return QStringLiteral("undefined");
}

} // namespace Herald
