#include "core/shared/types.h"

#include <QJsonArray>

namespace cw {

namespace {

QJsonObject histogramToJson(const QMap<QString, int>& histogram)
{
    QJsonObject json;
    for (auto it = histogram.cbegin(); it != histogram.cend(); ++it) {
        json.insert(it.key(), it.value());
    }
    return json;
}

void insertTime(QJsonObject& json, const QString& key, const QDateTime& value)
{
    if (value.isValid()) {
        json.insert(key, value.toUTC().toString(Qt::ISODateWithMs));
    }
}

} // namespace

QString providerToString(Provider provider)
{
    switch (provider) {
    case Provider::Codex:  return QStringLiteral("codex");
    case Provider::Claude: return QStringLiteral("claude");
    }
    return QStringLiteral("codex");
}

std::optional<Provider> providerFromString(const QString& str)
{
    if (str == QLatin1String("codex"))  return Provider::Codex;
    if (str == QLatin1String("claude")) return Provider::Claude;
    return std::nullopt;
}

QJsonObject messageToJson(const Message& message)
{
    QJsonObject json;
    if (!message.id.isEmpty()) {
        json.insert(QStringLiteral("id"), message.id);
    }
    json.insert(QStringLiteral("session_id"), message.sessionId);
    if (message.timestamp.has_value()) {
        insertTime(json, QStringLiteral("ts"), message.timestamp.value());
    }
    if (!message.role.isEmpty()) {
        json.insert(QStringLiteral("role"), message.role);
    }
    if (!message.content.isEmpty()) {
        json.insert(QStringLiteral("content"), message.content);
    }
    if (!message.thinking.isEmpty()) {
        json.insert(QStringLiteral("thinking"), message.thinking);
    }
    if (!message.model.isEmpty()) {
        json.insert(QStringLiteral("model"), message.model);
    }
    if (!message.recordType.isEmpty()) {
        json.insert(QStringLiteral("type"), message.recordType);
    }
    if (!message.toolName.isEmpty()) {
        json.insert(QStringLiteral("tool_name"), message.toolName);
    }
    if (!message.cwd.isEmpty()) {
        json.insert(QStringLiteral("cwd"), message.cwd);
    }
    json.insert(QStringLiteral("raw"), message.raw);
    json.insert(QStringLiteral("source"), message.source);
    json.insert(QStringLiteral("provider"), providerToString(message.provider));
    json.insert(QStringLiteral("line_no"), message.lineNo);
    return json;
}

QJsonObject sessionToJson(const Session& session)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), session.id);
    if (!session.title.isEmpty()) {
        json.insert(QStringLiteral("title"), session.title);
    }
    json.insert(QStringLiteral("custom_title"), session.customTitle);
    insertTime(json, QStringLiteral("first_at"), session.firstAt);
    insertTime(json, QStringLiteral("last_at"), session.lastAt);
    insertTime(json, QStringLiteral("file_mod_at"), session.fileModAt);
    json.insert(QStringLiteral("message_count"), session.messageCount);
    json.insert(QStringLiteral("text_count"), session.textCount);
    if (!session.cwd.isEmpty()) {
        json.insert(QStringLiteral("cwd"), session.cwd);
        json.insert(QStringLiteral("cwd_base"), session.cwdBase);
    }
    json.insert(QStringLiteral("models"), histogramToJson(session.models));
    json.insert(QStringLiteral("roles"), histogramToJson(session.roles));
    json.insert(QStringLiteral("sources"), QJsonArray::fromStringList(session.sources));
    json.insert(QStringLiteral("provider"), providerToString(session.provider));
    if (!session.project.isEmpty()) {
        json.insert(QStringLiteral("project"), session.project);
    }
    return json;
}

QJsonObject indexStatsToJson(const IndexStats& stats)
{
    QJsonObject json;
    json.insert(QStringLiteral("total_messages"), stats.totalMessages);
    json.insert(QStringLiteral("total_sessions"), stats.totalSessions);
    json.insert(QStringLiteral("by_role"), histogramToJson(stats.byRole));
    json.insert(QStringLiteral("by_model"), histogramToJson(stats.byModel));
    json.insert(QStringLiteral("fields"), histogramToJson(stats.fields));
    json.insert(QStringLiteral("bad_lines"), stats.badLines);
    json.insert(QStringLiteral("files_scanned"), stats.filesScanned);
    json.insert(QStringLiteral("last_scan_ms"), stats.lastScanMs);
    return json;
}

} // namespace cw
