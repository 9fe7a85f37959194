// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace Herald {

// Key functions for interface classes to anchor vtables to this translation unit
// This prevents ODR violations when interfaces are used across shared library boundaries

ISettings::~ISettings() = default;

INotificationPresenter::~INotificationPresenter() = default;

int ISettings::timeoutForUrgency(Urgency urgency) const
{
    switch (urgency) {
    case Urgency::Low:
        return lowTimeoutMs();
    case Urgency::Critical:
        return criticalTimeoutMs();
    case Urgency::Normal:
        break;
    }
    return normalTimeoutMs();
}

} // namespace Herald
