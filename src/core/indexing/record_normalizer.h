#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace cw {

// Where a record came from. sessionKey is the file-derived key; a provider
// may replace it with a record-level session id.
struct RecordContext {
    Provider provider = Provider::Codex;
    QString project;
    QString sessionKey;
    QString source;
    int lineNo = 0;
};

// Converts one parsed transcript record into the canonical Message shape.
// Returns nullopt for records that must not be indexed.
class RecordNormalizer {
public:
    virtual ~RecordNormalizer() = default;

    virtual std::optional<Message> normalize(const RecordContext& context,
                                             const QJsonObject& raw) const = 0;

protected:
    // Fields common to both schemas: flat keys, text priority chain,
    // timestamp and working directory.
    static Message baseMessage(const RecordContext& context, const QJsonObject& raw);
};

// Codex: flat records, chat and tool events wrapped in type/payload.
class CodexRecordNormalizer : public RecordNormalizer {
public:
    std::optional<Message> normalize(const RecordContext& context,
                                     const QJsonObject& raw) const override;
};

// Claude: role/model/content nested under a message object with
// text, thinking, tool_use and tool_result parts.
class ClaudeRecordNormalizer : public RecordNormalizer {
public:
    std::optional<Message> normalize(const RecordContext& context,
                                     const QJsonObject& raw) const override;
};

const RecordNormalizer& normalizerFor(Provider provider);

} // namespace cw
