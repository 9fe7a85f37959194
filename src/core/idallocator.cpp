// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "idallocator.h"
#include "logging.h"

namespace Herald {

IdAllocator::IdAllocator(quint32 maxId)
    : m_maxId(qMax<quint32>(maxId, 1))
{
}

std::optional<quint32> IdAllocator::allocate(const ActivePredicate& isActive, quint64 activeCount)
{
    if (activeCount >= m_maxId) {
        qCWarning(lcStore) << "Identifier space exhausted:" << activeCount << "active notifications";
        return std::nullopt;
    }

    // At least one id is free, so the scan terminates within one full cycle
    bool wrapped = false;
    while (isActive && isActive(m_next)) {
        advance();
        if (m_next == 1) {
            if (wrapped) {
                return std::nullopt;
            }
            wrapped = true;
        }
    }

    const quint32 id = m_next;
    advance();
    return id;
}

void IdAllocator::reset()
{
    m_next = 1;
}

void IdAllocator::advance()
{
    m_next = (m_next >= m_maxId) ? 1 : m_next + 1;
}

} // namespace Herald
