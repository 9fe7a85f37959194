// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QtGlobal>
#include <functional>
#include <limits>
#include <optional>

namespace Herald {

/**
 * @brief Issues notification identifiers
 *
 * Ids start at 1 and increase monotonically. After the largest id the cursor
 * wraps back to 1; 0 is never issued and an id that is still active is skipped.
 *
 * Not thread-safe on its own. NotificationStore calls allocate() under the
 * same lock that guards the insertion, so the allocated id cannot be taken
 * by a concurrent request before it is stored.
 */
class HERALD_EXPORT IdAllocator
{
public:
    using ActivePredicate = std::function<bool(quint32)>;

    /**
     * @param maxId Largest id handed out before wrapping (tests use a small space)
     */
    explicit IdAllocator(quint32 maxId = std::numeric_limits<quint32>::max());

    /**
     * @brief Allocate the next free id
     * @param isActive Returns true for ids that are currently in use
     * @param activeCount Number of ids currently in use
     * @return The new id, or nullopt when every id in the space is active
     */
    std::optional<quint32> allocate(const ActivePredicate& isActive, quint64 activeCount);

    /**
     * @brief Id the next allocate() call will try first
     */
    quint32 peek() const
    {
        return m_next;
    }

    quint32 maxId() const
    {
        return m_maxId;
    }

    /**
     * @brief Restore the cursor to 1
     */
    void reset();

private:
    void advance();

    quint32 m_maxId;
    quint32 m_next = 1;
};

} // namespace Herald
