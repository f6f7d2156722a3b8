#include "core/query/tool_fields.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStringList>

#include <optional>

namespace cw {
namespace tools {

namespace {

// Top-level key, falling back to the same key inside payload.
QJsonValue lookup(const QJsonObject& raw, const char* key)
{
    const QJsonValue direct = raw.value(QLatin1String(key));
    if (!direct.isUndefined() && !direct.isNull()) {
        return direct;
    }
    return raw.value(QStringLiteral("payload")).toObject().value(QLatin1String(key));
}

std::optional<QJsonObject> parseObject(const QString& text)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return doc.object();
}

QString joinCommand(const QJsonValue& command)
{
    if (command.isString()) {
        return command.toString();
    }
    QStringList parts;
    for (const QJsonValue& element : command.toArray()) {
        if (element.isString()) {
            parts.append(element.toString());
        }
    }
    return parts.join(QLatin1Char(' '));
}

bool hasType(const Message& message, const char* type)
{
    return message.recordType.compare(QLatin1String(type), Qt::CaseInsensitive) == 0;
}

QJsonArray claudeParts(const Message& message)
{
    const QJsonValue nested = message.raw.value(QStringLiteral("message"));
    if (nested.isObject()) {
        return nested.toObject().value(QStringLiteral("content")).toArray();
    }
    return message.raw.value(QStringLiteral("content")).toArray();
}

QString toolResultText(const QJsonObject& part)
{
    const QJsonValue content = part.value(QStringLiteral("content"));
    if (content.isString()) {
        return content.toString();
    }
    QStringList texts;
    for (const QJsonValue& element : content.toArray()) {
        const QString text = element.toObject().value(QStringLiteral("text")).toString();
        if (!text.isEmpty()) {
            texts.append(text);
        }
    }
    return texts.join(QLatin1Char('\n'));
}

QString codexOutput(const Message& message, bool wantStderr)
{
    const QJsonValue output = lookup(message.raw, "output");
    if (output.isString()) {
        const QString text = output.toString();
        const std::optional<QJsonObject> parsed = parseObject(text);
        if (wantStderr) {
            return parsed ? parsed->value(QStringLiteral("stderr")).toString() : QString();
        }
        if (parsed) {
            for (const char* key : {"output", "stdout"}) {
                const QJsonValue value = parsed->value(QLatin1String(key));
                if (value.isString()) {
                    return value.toString();
                }
            }
        }
        return text;
    }
    if (output.isObject()) {
        const QJsonObject obj = output.toObject();
        if (wantStderr) {
            return obj.value(QStringLiteral("stderr")).toString();
        }
        for (const char* key : {"output", "stdout"}) {
            const QJsonValue value = obj.value(QLatin1String(key));
            if (value.isString()) {
                return value.toString();
            }
        }
    }
    return {};
}

QString claudeOutput(const Message& message, bool wantStderr)
{
    QStringList texts;
    for (const QJsonValue& element : claudeParts(message)) {
        const QJsonObject part = element.toObject();
        if (part.value(QStringLiteral("type")).toString() != QLatin1String("tool_result")) {
            continue;
        }
        if (part.value(QStringLiteral("is_error")).toBool(false) != wantStderr) {
            continue;
        }
        const QString text = toolResultText(part);
        if (!text.isEmpty()) {
            texts.append(text);
        }
    }
    return texts.join(QLatin1Char('\n'));
}

} // namespace

QString commandText(const Message& message)
{
    if (hasType(message, "function_call")) {
        const QJsonValue arguments = lookup(message.raw, "arguments");
        if (arguments.isString()) {
            const QString text = arguments.toString();
            if (const std::optional<QJsonObject> parsed = parseObject(text)) {
                const QString command = joinCommand(parsed->value(QStringLiteral("command")));
                if (!command.isEmpty()) {
                    return command;
                }
            }
            return text;
        }
        if (arguments.isObject()) {
            return joinCommand(arguments.toObject().value(QStringLiteral("command")));
        }
        return {};
    }

    if (message.provider != Provider::Claude) {
        return {};
    }
    QStringList commands;
    for (const QJsonValue& element : claudeParts(message)) {
        const QJsonObject part = element.toObject();
        if (part.value(QStringLiteral("type")).toString() != QLatin1String("tool_use")) {
            continue;
        }
        const QJsonObject input = part.value(QStringLiteral("input")).toObject();
        const QString command = input.value(QStringLiteral("command")).toString();
        if (!command.isEmpty()) {
            commands.append(command);
        } else if (!input.isEmpty()) {
            commands.append(QString::fromUtf8(QJsonDocument(input).toJson(QJsonDocument::Compact)));
        }
    }
    return commands.join(QLatin1Char('\n'));
}

QString stdoutText(const Message& message)
{
    if (hasType(message, "function_call_output")) {
        return codexOutput(message, false);
    }
    if (message.provider == Provider::Claude) {
        return claudeOutput(message, false);
    }
    return {};
}

QString stderrText(const Message& message)
{
    if (hasType(message, "function_call_output")) {
        return codexOutput(message, true);
    }
    if (message.provider == Provider::Claude) {
        return claudeOutput(message, true);
    }
    return {};
}

} // namespace tools
} // namespace cw
