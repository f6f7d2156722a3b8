#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace cw {

// Which text of a message satisfied the query.
enum class MatchField {
    Content,
    ToolCommand,
    Stdout,
    Stderr,
};

QString matchFieldToString(MatchField field);

struct SearchHit {
    QString sessionId;
    QString messageId;
    QString role;
    QString type;
    QString model;
    QString source;
    int lineNo = 0;
    std::optional<QDateTime> timestamp;
    MatchField field = MatchField::Content;
    QString preview;    // trimmed, at most 240 characters of the matched text
};

struct SearchResponse {
    std::vector<SearchHit> hits;
    int total = 0;          // every match seen before the scan stopped, offset included
    bool truncated = false; // time budget cut the scan short
    qint64 tookMs = 0;
};

QJsonObject searchHitToJson(const SearchHit& hit);
QJsonObject searchResponseToJson(const SearchResponse& response);

} // namespace cw
