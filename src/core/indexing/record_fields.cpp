#include "core/indexing/record_fields.h"

#include <QJsonArray>
#include <QLocale>
#include <QTimeZone>
#include <QStringList>

namespace cw {
namespace records {

namespace {

const QString kBlankLine = QStringLiteral("\n\n");

bool isBlank(const QString& s)
{
    return s.trimmed().isEmpty();
}

bool isTextPartType(const QString& type)
{
    return type == QLatin1String("text")
        || type == QLatin1String("input_text")
        || type == QLatin1String("output_text");
}

bool isAllDigits(const QString& s)
{
    if (s.isEmpty()) {
        return false;
    }
    for (const QChar ch : s) {
        if (ch < QLatin1Char('0') || ch > QLatin1Char('9')) {
            return false;
        }
    }
    return true;
}

QString messageLikeText(const QJsonValue& value)
{
    if (!value.isObject()) {
        return {};
    }
    const QJsonObject obj = value.toObject();
    QString text = contentText(obj.value(QStringLiteral("content")), true);
    if (!text.isEmpty()) {
        return text;
    }
    text = stringValue(obj.value(QStringLiteral("text"))).trimmed();
    if (!text.isEmpty()) {
        return text;
    }
    return stringValue(obj.value(QStringLiteral("message"))).trimmed();
}

QString directCwd(const QJsonObject& obj)
{
    static const char* const kKeys[] = {"cwd", "working_dir", "current_working_directory"};
    for (const char* key : kKeys) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isString()) {
            const QString cwd = value.toString().trimmed();
            if (!cwd.isEmpty()) {
                return cwd;
            }
        }
    }
    return {};
}

QString gitCwd(const QJsonObject& obj)
{
    const QJsonValue git = obj.value(QStringLiteral("git"));
    if (!git.isObject()) {
        return {};
    }
    const QJsonObject gitObj = git.toObject();
    for (const char* key : {"cwd", "root"}) {
        const QJsonValue value = gitObj.value(QLatin1String(key));
        if (value.isString()) {
            const QString cwd = value.toString().trimmed();
            if (!cwd.isEmpty()) {
                return cwd;
            }
        }
    }
    return {};
}

QString environmentContextCwd(const QJsonObject& obj)
{
    const QJsonValue env = obj.value(QStringLiteral("environment_context"));
    if (!env.isString()) {
        return {};
    }
    const QString text = env.toString().trimmed();
    if (text.isEmpty()) {
        return {};
    }
    const QString exact = cwdFromMarkup(text);
    if (!exact.isEmpty()) {
        return exact;
    }
    // Unclosed marker: take everything up to the next tag.
    const int start = text.indexOf(QLatin1String("<cwd>"), 0, Qt::CaseInsensitive);
    if (start < 0) {
        return {};
    }
    const QString rest = text.mid(start + 5);
    const int end = rest.indexOf(QLatin1Char('<'));
    if (end > 0) {
        return rest.left(end).trimmed();
    }
    return {};
}

QString contentCwd(const QJsonValue& content)
{
    if (content.isString()) {
        return cwdFromMarkup(content.toString());
    }
    if (!content.isArray()) {
        return {};
    }
    for (const QJsonValue& element : content.toArray()) {
        if (element.isString()) {
            const QString cwd = cwdFromMarkup(element.toString());
            if (!cwd.isEmpty()) {
                return cwd;
            }
            continue;
        }
        if (!element.isObject()) {
            continue;
        }
        const QJsonObject part = element.toObject();
        if (!isTextPartType(part.value(QStringLiteral("type")).toString())) {
            continue;
        }
        for (const char* key : {"text", "content"}) {
            const QString cwd = cwdFromMarkup(part.value(QLatin1String(key)).toString());
            if (!cwd.isEmpty()) {
                return cwd;
            }
        }
    }
    return {};
}

} // namespace

QString stringValue(const QJsonValue& value)
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(value.toDouble(), 'g', QLocale::FloatingPointShortest);
    }
    return {};
}

QString extractText(const QJsonObject& raw)
{
    QString text = messageLikeText(raw.value(QStringLiteral("message")));
    if (!text.isEmpty()) {
        return text;
    }
    // Codex keeps most chat text under payload.
    text = messageLikeText(raw.value(QStringLiteral("payload")));
    if (!text.isEmpty()) {
        return text;
    }
    text = contentText(raw.value(QStringLiteral("content")), false);
    if (!text.isEmpty()) {
        return text;
    }
    text = stringValue(raw.value(QStringLiteral("text"))).trimmed();
    if (!text.isEmpty()) {
        return text;
    }
    return stringValue(raw.value(QStringLiteral("message"))).trimmed();
}

QString contentText(const QJsonValue& content, bool includeOtherTyped)
{
    if (content.isString()) {
        const QString text = content.toString();
        return isBlank(text) ? QString() : text;
    }
    if (!content.isArray()) {
        return {};
    }

    QStringList parts;
    const auto appendPart = [&parts](const QString& s) {
        if (!isBlank(s)) {
            parts.append(s);
        }
    };

    for (const QJsonValue& element : content.toArray()) {
        if (element.isString()) {
            appendPart(element.toString());
            continue;
        }
        if (!element.isObject()) {
            continue;
        }
        const QJsonObject part = element.toObject();
        const QString type = stringValue(part.value(QStringLiteral("type"))).toLower();
        if (isTextPartType(type)) {
            const QString text = stringValue(part.value(QStringLiteral("text")));
            if (!isBlank(text)) {
                appendPart(text);
                continue;
            }
            appendPart(stringValue(part.value(QStringLiteral("content"))));
            continue;
        }
        if (type == QLatin1String("thinking")) {
            continue;
        }
        if (includeOtherTyped) {
            appendPart(stringValue(part.value(QStringLiteral("text"))));
        }
    }
    return parts.join(kBlankLine);
}

QString extractCwd(const QJsonObject& raw)
{
    const QJsonObject payload = raw.value(QStringLiteral("payload")).toObject();
    const QJsonObject message = raw.value(QStringLiteral("message")).toObject();

    QString cwd = directCwd(raw);
    if (cwd.isEmpty()) cwd = directCwd(payload);
    if (cwd.isEmpty()) cwd = gitCwd(raw);
    if (cwd.isEmpty()) cwd = gitCwd(payload);
    if (cwd.isEmpty()) cwd = environmentContextCwd(raw);
    if (cwd.isEmpty()) cwd = environmentContextCwd(payload);
    if (cwd.isEmpty()) cwd = contentCwd(raw.value(QStringLiteral("content")));
    if (cwd.isEmpty()) cwd = contentCwd(payload.value(QStringLiteral("content")));
    if (cwd.isEmpty()) cwd = contentCwd(message.value(QStringLiteral("content")));
    return cwd;
}

QString cwdFromMarkup(const QString& text)
{
    static const QString kOpen = QStringLiteral("<cwd>");
    static const QString kClose = QStringLiteral("</cwd>");

    const int open = text.indexOf(kOpen);
    if (open < 0) {
        return {};
    }
    const int start = open + kOpen.size();
    const int close = text.indexOf(kClose, start);
    if (close < 0) {
        return {};
    }
    return text.mid(start, close - start).trimmed();
}

std::optional<QDateTime> parseTimestamp(const QJsonObject& raw)
{
    for (const char* key : {"timestamp", "ts", "created_at"}) {
        const auto parsed = parseTimestampValue(raw.value(QLatin1String(key)));
        if (parsed.has_value()) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<QDateTime> parseTimestampValue(const QJsonValue& value)
{
    if (value.isString()) {
        const QString text = value.toString().trimmed();
        if (text.isEmpty()) {
            return std::nullopt;
        }
        if (isAllDigits(text)) {
            bool ok = false;
            const qint64 secs = text.toLongLong(&ok);
            if (ok) {
                return QDateTime::fromSecsSinceEpoch(secs, QTimeZone::UTC);
            }
            return std::nullopt;
        }
        const QDateTime parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
        if (parsed.isValid()) {
            return parsed.toUTC();
        }
        return std::nullopt;
    }
    if (value.isDouble()) {
        const double secs = value.toDouble();
        if (secs > 1000000000.0) {
            return QDateTime::fromSecsSinceEpoch(static_cast<qint64>(secs), QTimeZone::UTC);
        }
    }
    return std::nullopt;
}

bool isDuplicateEventRecord(const QJsonObject& raw)
{
    if (stringValue(raw.value(QStringLiteral("type"))).toLower() != QLatin1String("event_msg")) {
        return false;
    }
    const QJsonValue payload = raw.value(QStringLiteral("payload"));
    if (!payload.isObject()) {
        return false;
    }
    const QString payloadType =
        stringValue(payload.toObject().value(QStringLiteral("type"))).toLower();
    return payloadType == QLatin1String("user_message")
        || payloadType == QLatin1String("agent_message");
}

} // namespace records
} // namespace cw
