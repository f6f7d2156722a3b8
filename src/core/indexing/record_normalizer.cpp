#include "core/indexing/record_normalizer.h"
#include "core/indexing/record_fields.h"

#include <QJsonArray>
#include <QStringList>

namespace cw {

namespace {

const QString kBlankLine = QStringLiteral("\n\n");

QString field(const QJsonObject& obj, const char* key)
{
    return records::stringValue(obj.value(QLatin1String(key)));
}

void appendNonBlank(QStringList& parts, const QString& text)
{
    if (!text.trimmed().isEmpty()) {
        parts.append(text);
    }
}

// Codex reasoning payloads carry their summary as summary_text parts.
QString codexReasoningText(const QJsonObject& payload)
{
    QStringList parts;
    for (const QJsonValue& element : payload.value(QStringLiteral("summary")).toArray()) {
        if (element.isString()) {
            appendNonBlank(parts, element.toString());
        } else if (element.isObject()) {
            appendNonBlank(parts, field(element.toObject(), "text"));
        }
    }
    return parts.join(kBlankLine);
}

struct ClaudeSegments {
    QString text;
    QString thinking;
    QString toolName;
};

ClaudeSegments claudeSegments(const QJsonObject& message)
{
    ClaudeSegments segments;
    const QJsonValue content = message.value(QStringLiteral("content"));
    if (content.isString()) {
        segments.text = content.toString();
        return segments;
    }

    QStringList text;
    QStringList thinking;
    for (const QJsonValue& element : content.toArray()) {
        if (!element.isObject()) {
            continue;
        }
        const QJsonObject part = element.toObject();
        const QString type = field(part, "type").toLower();
        if (type == QLatin1String("text") || type == QLatin1String("input_text")
            || type == QLatin1String("output_text")) {
            appendNonBlank(text, field(part, "text"));
            appendNonBlank(text, field(part, "content"));
        } else if (type == QLatin1String("thinking")) {
            appendNonBlank(thinking, field(part, "thinking"));
        } else if (type == QLatin1String("tool_use") && segments.toolName.isEmpty()) {
            segments.toolName = field(part, "name");
        }
    }
    segments.text = text.join(kBlankLine);
    segments.thinking = thinking.join(kBlankLine);
    return segments;
}

} // namespace

Message RecordNormalizer::baseMessage(const RecordContext& context, const QJsonObject& raw)
{
    Message message;
    message.id = field(raw, "id");
    message.sessionId = context.sessionKey;
    message.timestamp = records::parseTimestamp(raw);
    message.role = field(raw, "role");
    message.content = records::extractText(raw);
    message.model = field(raw, "model");
    message.recordType = field(raw, "type");
    message.toolName = field(raw, "tool_name");
    message.cwd = records::extractCwd(raw);
    message.raw = raw;
    message.source = context.source;
    message.provider = context.provider;
    message.lineNo = context.lineNo;
    return message;
}

std::optional<Message> CodexRecordNormalizer::normalize(const RecordContext& context,
                                                        const QJsonObject& raw) const
{
    if (records::isDuplicateEventRecord(raw)) {
        return std::nullopt;
    }

    Message message = baseMessage(context, raw);

    const QString recordSession = field(raw, "session_id");
    if (!recordSession.isEmpty()) {
        message.sessionId = recordSession;
    }

    const QJsonValue payloadValue = raw.value(QStringLiteral("payload"));
    if (!payloadValue.isObject()) {
        return message;
    }
    const QJsonObject payload = payloadValue.toObject();

    const QString outerType = message.recordType.toLower();
    const QString payloadType = field(payload, "type");
    if ((outerType == QLatin1String("response_item") || outerType == QLatin1String("event_msg"))
        && !payloadType.isEmpty()) {
        message.recordType = payloadType;
    }

    if (message.id.isEmpty()) {
        message.id = field(payload, "id");
    }
    if (message.role.isEmpty()) {
        message.role = field(payload, "role");
    }
    if (message.model.isEmpty()) {
        message.model = field(payload, "model");
    }
    if (message.toolName.isEmpty() && payloadType.endsWith(QLatin1String("_call"))) {
        message.toolName = field(payload, "name");
    }
    if (payloadType == QLatin1String("reasoning")) {
        message.thinking = codexReasoningText(payload);
    }
    return message;
}

std::optional<Message> ClaudeRecordNormalizer::normalize(const RecordContext& context,
                                                         const QJsonObject& raw) const
{
    Message message = baseMessage(context, raw);

    if (message.id.isEmpty()) {
        message.id = field(raw, "uuid");
    }

    const QJsonValue nested = raw.value(QStringLiteral("message"));
    if (!nested.isObject()) {
        return message;
    }
    const QJsonObject nestedMessage = nested.toObject();

    if (message.role.isEmpty()) {
        message.role = field(nestedMessage, "role");
    }
    if (message.model.isEmpty()) {
        message.model = field(nestedMessage, "model");
    }

    const ClaudeSegments segments = claudeSegments(nestedMessage);
    if (!segments.text.trimmed().isEmpty()) {
        message.content = segments.text;
    }
    if (!segments.thinking.trimmed().isEmpty()) {
        message.thinking = segments.thinking;
    }
    if (message.toolName.isEmpty()) {
        message.toolName = segments.toolName;
    }
    // Session identity stays file-derived so resumed sessions sharing a file merge.
    return message;
}

const RecordNormalizer& normalizerFor(Provider provider)
{
    static const CodexRecordNormalizer codex;
    static const ClaudeRecordNormalizer claude;
    switch (provider) {
    case Provider::Codex:  return codex;
    case Provider::Claude: return claude;
    }
    return codex;
}

} // namespace cw
