// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "herald_export.h"
#include <QByteArray>
#include <QString>

namespace Herald {

/**
 * @brief Validation and normalization of client-supplied notification text
 *
 * Everything a client sends is untrusted. The sanitizer keeps the stored text
 * as close to the caller's input as possible (so bodies round-trip) and derives
 * a separate, safe markup string for the presenter.
 *
 * Policy:
 * - Malformed UTF-8 and unpaired surrogates are replaced with U+FFFD, never rejected
 * - NUL and other control characters are removed, except newline and tab
 * - CRLF and lone CR become LF; embedded newlines are preserved, not collapsed
 * - Over-long text is cut on a code point boundary and ends with U+2026
 */
namespace TextSanitizer {

/**
 * @brief Decode raw bytes as UTF-8, replacing malformed sequences with U+FFFD
 */
HERALD_EXPORT QString fromUtf8Lossy(const QByteArray& bytes);

/**
 * @brief Normalize encoding, control characters and line breaks
 * @param input Text as received from the bus
 * @param maxLength Maximum length in UTF-16 code units (0 = unlimited)
 * @return Sanitized text; identical to @p input when nothing needed fixing
 */
HERALD_EXPORT QString sanitizeText(const QString& input, int maxLength = 0);

/**
 * @brief Sanitize a summary line
 *
 * Same as sanitizeText(), plus each run of line breaks is folded into a
 * single space since a summary is a one-line overview.
 */
HERALD_EXPORT QString sanitizeSummary(const QString& input, int maxLength = 0);

/**
 * @brief Cut @p text to @p maxLength code units without splitting a surrogate pair
 */
HERALD_EXPORT QString truncate(const QString& text, int maxLength);

/**
 * @brief Escape the five XML special characters (& < > " ')
 */
HERALD_EXPORT QString escape(const QString& text);

/**
 * @brief Build the markup string handed to the presenter
 * @param body Stored (sanitized) body text
 * @param markupEnabled Whether the body-markup capability is advertised
 * @return Markup that is always well formed
 *
 * With markup disabled the whole body is escaped and renders literally.
 * With markup enabled the recognized subset is kept:
 *   <b> <i> <u>                 bold, italic, underline
 *   <a href="...">              http, https, mailto and file links only
 *   <img src="..." alt="...">   inline image
 *   <br>                        line break
 * Anything else that looks like a tag, and any unbalanced closing tag, is
 * escaped. Only &amp; &lt; &gt; &quot; &apos; survive as entities. Tags left
 * open at the end of the body are closed.
 */
HERALD_EXPORT QString toDisplayMarkup(const QString& body, bool markupEnabled);

/**
 * @brief Remove recognized markup tags and decode the basic entities
 *
 * Used for log output and history search; unrecognized "tags" such as
 * "<angle>" are left in place as plain text.
 */
HERALD_EXPORT QString stripMarkup(const QString& body);

} // namespace TextSanitizer

} // namespace Herald
