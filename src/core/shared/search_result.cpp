#include "core/shared/search_result.h"

#include <QJsonArray>

namespace cw {

QString matchFieldToString(MatchField field)
{
    switch (field) {
    case MatchField::Content:     return QStringLiteral("content");
    case MatchField::ToolCommand: return QStringLiteral("tool_cmd");
    case MatchField::Stdout:      return QStringLiteral("stdout");
    case MatchField::Stderr:      return QStringLiteral("stderr");
    }
    return QStringLiteral("content");
}

QJsonObject searchHitToJson(const SearchHit& hit)
{
    QJsonObject json;
    json.insert(QStringLiteral("session_id"), hit.sessionId);
    if (!hit.messageId.isEmpty()) {
        json.insert(QStringLiteral("message_id"), hit.messageId);
    }
    if (!hit.role.isEmpty()) {
        json.insert(QStringLiteral("role"), hit.role);
    }
    if (!hit.type.isEmpty()) {
        json.insert(QStringLiteral("type"), hit.type);
    }
    if (!hit.model.isEmpty()) {
        json.insert(QStringLiteral("model"), hit.model);
    }
    if (!hit.source.isEmpty()) {
        json.insert(QStringLiteral("source"), hit.source);
    }
    if (hit.lineNo > 0) {
        json.insert(QStringLiteral("line_no"), hit.lineNo);
    }
    if (hit.timestamp.has_value() && hit.timestamp->isValid()) {
        json.insert(QStringLiteral("ts"), hit.timestamp->toUTC().toString(Qt::ISODateWithMs));
    }
    json.insert(QStringLiteral("field"), matchFieldToString(hit.field));
    if (!hit.preview.isEmpty()) {
        json.insert(QStringLiteral("content"), hit.preview);
    }
    return json;
}

QJsonObject searchResponseToJson(const SearchResponse& response)
{
    QJsonArray hits;
    for (const SearchHit& hit : response.hits) {
        hits.append(searchHitToJson(hit));
    }

    QJsonObject json;
    json.insert(QStringLiteral("took_ms"), response.tookMs);
    json.insert(QStringLiteral("truncated"), response.truncated);
    json.insert(QStringLiteral("total"), response.total);
    json.insert(QStringLiteral("hits"), hits);
    return json;
}

} // namespace cw
