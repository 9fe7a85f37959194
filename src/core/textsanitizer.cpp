// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "textsanitizer.h"
#include "logging.h"

#include <QHash>
#include <QRegularExpression>
#include <QStringList>
#include <QUrl>
#include <optional>

namespace Herald {
namespace TextSanitizer {

namespace {

constexpr char16_t Ellipsis = 0x2026;

// Entities that are allowed to pass through toDisplayMarkup() unchanged
constexpr QLatin1String kAllowedEntities[] = {
    QLatin1String("&amp;"), QLatin1String("&lt;"), QLatin1String("&gt;"),
    QLatin1String("&quot;"), QLatin1String("&apos;"),
};

bool isStrippedControl(char16_t u)
{
    if (u == u'\n' || u == u'\t') {
        return false;
    }
    return u < 0x20 || u == 0x7f || (u >= 0x80 && u < 0xa0);
}

QString decodeEntities(QString text)
{
    text.replace(QLatin1String("&lt;"), QLatin1String("<"));
    text.replace(QLatin1String("&gt;"), QLatin1String(">"));
    text.replace(QLatin1String("&quot;"), QLatin1String("\""));
    text.replace(QLatin1String("&apos;"), QLatin1String("'"));
    text.replace(QLatin1String("&amp;"), QLatin1String("&"));
    return text;
}

/**
 * @brief Parse name="value" pairs from the inside of a tag
 * @return Attribute map, or nullopt if anything other than attributes is present
 */
std::optional<QHash<QString, QString>> parseAttributes(const QString& text)
{
    static const QRegularExpression attributeRe(
        QStringLiteral(R"(([A-Za-z][A-Za-z0-9_-]*)\s*=\s*(?:"([^"]*)"|'([^']*)'))"));

    QHash<QString, QString> attributes;
    qsizetype consumed = 0;
    auto it = attributeRe.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        // Only whitespace may separate attributes
        if (!text.mid(consumed, match.capturedStart() - consumed).trimmed().isEmpty()) {
            return std::nullopt;
        }
        const QString value = match.capturedStart(2) >= 0 ? match.captured(2) : match.captured(3);
        attributes.insert(match.captured(1).toLower(), decodeEntities(value));
        consumed = match.capturedEnd();
    }
    if (!text.mid(consumed).trimmed().isEmpty()) {
        return std::nullopt;
    }
    return attributes;
}

bool isAllowedLink(const QString& href)
{
    const QUrl url(href);
    if (!url.isValid()) {
        return false;
    }
    const QString scheme = url.scheme().toLower();
    return scheme == QLatin1String("http") || scheme == QLatin1String("https")
        || scheme == QLatin1String("mailto") || scheme == QLatin1String("file");
}

/**
 * @brief Normalize one tag of the recognized subset
 * @param tag Tag content between '<' and '>'
 * @param openTags Stack of currently open tags, updated on success
 * @return Normalized tag text, or nullopt if the tag must be escaped
 */
std::optional<QString> normalizeTag(QStringView tag, QStringList& openTags)
{
    tag = tag.trimmed();
    if (tag.isEmpty()) {
        return std::nullopt;
    }

    if (tag.startsWith(u'/')) {
        const QString name = tag.mid(1).trimmed().toString().toLower();
        // Strict nesting: only the innermost open tag may be closed
        if (!openTags.isEmpty() && openTags.last() == name) {
            openTags.removeLast();
            return QStringLiteral("</%1>").arg(name);
        }
        return std::nullopt;
    }

    bool selfClosing = false;
    if (tag.endsWith(u'/')) {
        selfClosing = true;
        tag = tag.chopped(1).trimmed();
    }

    qsizetype nameEnd = 0;
    while (nameEnd < tag.size() && !tag.at(nameEnd).isSpace()) {
        ++nameEnd;
    }
    const QString name = tag.left(nameEnd).toString().toLower();
    const QString rest = tag.mid(nameEnd).toString();

    if (name == QLatin1String("b") || name == QLatin1String("i") || name == QLatin1String("u")) {
        if (selfClosing || !rest.trimmed().isEmpty()) {
            return std::nullopt;
        }
        openTags.append(name);
        return QStringLiteral("<%1>").arg(name);
    }

    if (name == QLatin1String("br")) {
        if (!rest.trimmed().isEmpty()) {
            return std::nullopt;
        }
        return QStringLiteral("<br/>");
    }

    const auto attributes = parseAttributes(rest);
    if (!attributes) {
        return std::nullopt;
    }

    if (name == QLatin1String("a")) {
        const QString href = attributes->value(QStringLiteral("href"));
        if (selfClosing || attributes->size() != 1 || !isAllowedLink(href)) {
            return std::nullopt;
        }
        openTags.append(name);
        return QStringLiteral("<a href=\"%1\">").arg(escape(href));
    }

    if (name == QLatin1String("img")) {
        const QString src = attributes->value(QStringLiteral("src"));
        if (src.isEmpty()) {
            return std::nullopt;
        }
        for (auto it = attributes->constBegin(); it != attributes->constEnd(); ++it) {
            if (it.key() != QLatin1String("src") && it.key() != QLatin1String("alt")) {
                return std::nullopt;
            }
        }
        return QStringLiteral("<img src=\"%1\" alt=\"%2\"/>")
            .arg(escape(src), escape(attributes->value(QStringLiteral("alt"))));
    }

    return std::nullopt;
}

} // anonymous namespace

QString fromUtf8Lossy(const QByteArray& bytes)
{
    // QString::fromUtf8 substitutes U+FFFD for every malformed sequence
    return QString::fromUtf8(bytes);
}

QString sanitizeText(const QString& input, int maxLength)
{
    QString result;
    result.reserve(input.size());

    int replaced = 0;
    int removed = 0;
    const qsizetype size = input.size();
    for (qsizetype i = 0; i < size; ++i) {
        const QChar c = input.at(i);

        if (c.isHighSurrogate()) {
            if (i + 1 < size && input.at(i + 1).isLowSurrogate()) {
                result.append(c);
                result.append(input.at(i + 1));
                ++i;
            } else {
                result.append(QChar(QChar::ReplacementCharacter));
                ++replaced;
            }
            continue;
        }
        if (c.isLowSurrogate()) {
            result.append(QChar(QChar::ReplacementCharacter));
            ++replaced;
            continue;
        }

        const char16_t u = c.unicode();
        if (u == u'\r') {
            result.append(QChar(u'\n'));
            if (i + 1 < size && input.at(i + 1) == u'\n') {
                ++i;
            }
            continue;
        }
        if (isStrippedControl(u)) {
            ++removed;
            continue;
        }
        result.append(c);
    }

    if (replaced > 0 || removed > 0) {
        qCDebug(lcSanitizer) << "Sanitized text replaced=" << replaced << " removed=" << removed;
    }

    return truncate(result, maxLength);
}

QString sanitizeSummary(const QString& input, int maxLength)
{
    const QString text = sanitizeText(input, 0);

    QString folded;
    folded.reserve(text.size());
    bool inBreak = false;
    for (const QChar c : text) {
        if (c == u'\n') {
            if (!inBreak) {
                folded.append(QChar(u' '));
                inBreak = true;
            }
            continue;
        }
        inBreak = false;
        folded.append(c);
    }

    return truncate(folded, maxLength);
}

QString truncate(const QString& text, int maxLength)
{
    if (maxLength <= 0 || text.size() <= maxLength) {
        return text;
    }

    // Leave room for the ellipsis
    qsizetype cut = maxLength - 1;
    if (cut > 0 && text.at(cut - 1).isHighSurrogate()) {
        --cut;
    }

    qCDebug(lcSanitizer) << "Truncated text from" << text.size() << "to" << maxLength << "code units";
    return text.left(cut) + QChar(Ellipsis);
}

QString escape(const QString& text)
{
    QString result;
    result.reserve(text.size());
    for (const QChar c : text) {
        switch (c.unicode()) {
        case u'&':
            result += QLatin1String("&amp;");
            break;
        case u'<':
            result += QLatin1String("&lt;");
            break;
        case u'>':
            result += QLatin1String("&gt;");
            break;
        case u'"':
            result += QLatin1String("&quot;");
            break;
        case u'\'':
            result += QLatin1String("&apos;");
            break;
        default:
            result += c;
        }
    }
    return result;
}

QString toDisplayMarkup(const QString& body, bool markupEnabled)
{
    if (!markupEnabled) {
        return escape(body);
    }

    QString result;
    result.reserve(body.size());
    QStringList openTags;

    const QStringView view(body);
    qsizetype i = 0;
    while (i < view.size()) {
        const QChar c = view.at(i);

        if (c == u'<') {
            const qsizetype close = view.indexOf(u'>', i + 1);
            if (close > i) {
                const QStringView inner = view.mid(i + 1, close - i - 1);
                if (!inner.contains(u'<')) {
                    if (const auto tag = normalizeTag(inner, openTags)) {
                        result += *tag;
                        i = close + 1;
                        continue;
                    }
                }
            }
            result += QLatin1String("&lt;");
            ++i;
            continue;
        }

        if (c == u'&') {
            bool kept = false;
            for (const QLatin1String entity : kAllowedEntities) {
                if (view.mid(i).startsWith(entity)) {
                    result += entity;
                    i += entity.size();
                    kept = true;
                    break;
                }
            }
            if (!kept) {
                result += QLatin1String("&amp;");
                ++i;
            }
            continue;
        }

        switch (c.unicode()) {
        case u'>':
            result += QLatin1String("&gt;");
            break;
        case u'"':
            result += QLatin1String("&quot;");
            break;
        case u'\'':
            result += QLatin1String("&apos;");
            break;
        default:
            result += c;
        }
        ++i;
    }

    while (!openTags.isEmpty()) {
        result += QStringLiteral("</%1>").arg(openTags.takeLast());
    }

    return result;
}

QString stripMarkup(const QString& body)
{
    static const QRegularExpression tagRe(QStringLiteral(R"(</?(?:b|i|u|a|img|br)(?:\s[^<>]*)?/?>)"),
                                          QRegularExpression::CaseInsensitiveOption);
    QString text = body;
    text.remove(tagRe);
    return decodeEntities(text);
}

} // namespace TextSanitizer
} // namespace Herald
