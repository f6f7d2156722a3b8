#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace cw {
namespace records {

// Scalar JSON value as text: strings verbatim, numbers in shortest form,
// anything else empty.
QString stringValue(const QJsonValue& value);

// Human-readable text of a record, first hit wins:
// message object -> payload object -> content -> text -> message string.
// Arrays of typed parts keep only text-bearing parts, joined by a blank line.
// Thinking parts never contribute.
QString extractText(const QJsonObject& raw);

// Text-bearing parts of a content value (string or array of parts).
// includeOtherTyped also accepts the "text" of parts with unrecognised types.
QString contentText(const QJsonValue& content, bool includeOtherTyped);

// Working directory revealed by a record, first hit wins:
// direct fields -> git object -> environment_context markup -> <cwd> in text parts.
QString extractCwd(const QJsonObject& raw);

// Trimmed text between <cwd> and </cwd>, or empty.
QString cwdFromMarkup(const QString& text);

// timestamp / ts / created_at as RFC3339 (optionally fractional) or unix seconds.
std::optional<QDateTime> parseTimestamp(const QJsonObject& raw);
std::optional<QDateTime> parseTimestampValue(const QJsonValue& value);

// True for an event_msg wrapper restating a user/agent message that a
// response_item record already carries.
bool isDuplicateEventRecord(const QJsonObject& raw);

} // namespace records
} // namespace cw
