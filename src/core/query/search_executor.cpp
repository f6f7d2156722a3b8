#include "core/query/search_executor.h"
#include "core/index/index_store.h"
#include "core/query/tool_fields.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QHash>
#include <QStringList>

#include <algorithm>
#include <optional>

namespace cw {

namespace {

// Metadata filters gathered from every OR-group.
struct FieldFilters {
    QHash<QString, QStringList> allow;
    QHash<QString, QStringList> deny;
};

FieldFilters collectFieldFilters(const CompiledQuery& query)
{
    FieldFilters filters;
    for (const ClauseGroup& group : query.groups) {
        for (const Clause& clause : group) {
            if (clause.kind != Clause::Kind::Field) {
                continue;
            }
            QHash<QString, QStringList>& target = clause.negative ? filters.deny : filters.allow;
            target[clause.field].append(clause.value);
        }
    }
    return filters;
}

bool fieldValueMatches(const QString& field, const QString& got, const QString& want)
{
    const QString wanted = want.trimmed().toLower();
    if (wanted.isEmpty()) {
        return true;
    }
    const QString actual = got.trimmed().toLower();
    if (field == QLatin1String("cwd")) {
        // Substring so a parent directory also selects its subdirectories.
        return actual.contains(wanted);
    }
    return actual == wanted;
}

bool passesField(const FieldFilters& filters, const QString& field, const QString& got)
{
    const auto allowed = filters.allow.constFind(field);
    if (allowed != filters.allow.cend()) {
        const bool any = std::any_of(allowed->cbegin(), allowed->cend(), [&](const QString& want) {
            return fieldValueMatches(field, got, want);
        });
        if (!any) {
            return false;
        }
    }
    const auto denied = filters.deny.constFind(field);
    if (denied != filters.deny.cend()) {
        for (const QString& want : denied.value()) {
            if (fieldValueMatches(field, got, want)) {
                return false;
            }
        }
    }
    return true;
}

bool passesFieldFilters(const FieldFilters& filters, const Message& message,
                        const Session& session)
{
    if (filters.allow.isEmpty() && filters.deny.isEmpty()) {
        return true;
    }
    return passesField(filters, QStringLiteral("role"), message.role)
        && passesField(filters, QStringLiteral("type"), message.recordType)
        && passesField(filters, QStringLiteral("model"), message.model)
        && passesField(filters, QStringLiteral("cwd"), session.cwd)
        && passesField(filters, QStringLiteral("cwd_base"), session.cwdBase);
}

struct Target {
    MatchField field;
    QString text;
    QString lower;
};

Target makeTarget(MatchField field, const QString& text)
{
    return Target{field, text, text.toLower()};
}

bool clauseMatches(const Clause& clause, const Target& target)
{
    switch (clause.kind) {
    case Clause::Kind::Term:
    case Clause::Kind::Phrase:
    case Clause::Kind::Prefix:
        return clause.value.isEmpty() || target.lower.contains(clause.value);
    case Clause::Kind::Regex:
        return clause.regex.match(target.text).hasMatch();
    case Clause::Kind::NeverMatch:
        return false;
    case Clause::Kind::Field:
        return true;
    }
    return false;
}

// First in-scope target the clause matches.
std::optional<MatchField> firstMatch(const Clause& clause, const std::vector<Target>& targets)
{
    for (const Target& target : targets) {
        if (clauseMatches(clause, target)) {
            return target.field;
        }
    }
    return std::nullopt;
}

// Evaluates the text DNF. Returns the field of the first positive clause
// that matched in the first satisfied group.
std::optional<MatchField> matchText(const CompiledQuery& query, const std::vector<Target>& targets)
{
    for (const ClauseGroup& group : query.groups) {
        bool satisfied = true;
        std::optional<MatchField> hitField;
        for (const Clause& clause : group) {
            if (clause.kind == Clause::Kind::Field) {
                continue;
            }
            const std::optional<MatchField> hit = firstMatch(clause, targets);
            if (clause.negative ? hit.has_value() : !hit.has_value()) {
                satisfied = false;
                break;
            }
            if (!clause.negative && !hitField.has_value()) {
                hitField = hit;
            }
        }
        if (satisfied) {
            if (hitField.has_value()) {
                return hitField;
            }
            return query.scope == Scope::Tools ? MatchField::ToolCommand : MatchField::Content;
        }
    }
    return std::nullopt;
}

std::vector<Target> targetsFor(Scope scope, const Message& message)
{
    std::vector<Target> targets;
    if (scope == Scope::Content || scope == Scope::All) {
        targets.push_back(makeTarget(MatchField::Content, message.content));
    }
    if (scope == Scope::Tools || scope == Scope::All) {
        targets.push_back(makeTarget(MatchField::ToolCommand, tools::commandText(message)));
        targets.push_back(makeTarget(MatchField::Stdout, tools::stdoutText(message)));
        targets.push_back(makeTarget(MatchField::Stderr, tools::stderrText(message)));
    }
    return targets;
}

// First count code points of text; never splits a surrogate pair.
QString leftCodePoints(const QString& text, int count)
{
    qsizetype end = 0;
    for (int taken = 0; taken < count && end < text.size(); ++taken) {
        const bool pair = text.at(end).isHighSurrogate() && end + 1 < text.size()
            && text.at(end + 1).isLowSurrogate();
        end += pair ? 2 : 1;
    }
    return text.left(end);
}

QString previewOf(const std::vector<Target>& targets, MatchField field)
{
    for (const Target& target : targets) {
        if (target.field == field) {
            return leftCodePoints(target.text.trimmed(), SearchExecutor::kPreviewLength);
        }
    }
    return {};
}

bool hitOrder(const SearchHit& a, const SearchHit& b)
{
    const bool aHasTs = a.timestamp.has_value() && a.timestamp->isValid();
    const bool bHasTs = b.timestamp.has_value() && b.timestamp->isValid();
    if (aHasTs != bHasTs) {
        return aHasTs;
    }
    if (aHasTs && a.timestamp.value() != b.timestamp.value()) {
        return a.timestamp.value() > b.timestamp.value();
    }
    if (a.source != b.source) {
        return a.source < b.source;
    }
    return a.lineNo < b.lineNo;
}

} // namespace

SearchExecutor::SearchExecutor(SearchLimits limits)
    : m_limits(limits)
{
}

SearchResponse SearchExecutor::exec(const IndexStore& store, const CompiledQuery& query,
                                    int limit, int offset) const
{
    QElapsedTimer timer;
    timer.start();

    if (limit <= 0) {
        limit = kDefaultLimit;
    }
    if (m_limits.maxReturn > 0 && limit > m_limits.maxReturn) {
        limit = m_limits.maxReturn;
    }
    offset = std::max(offset, 0);

    const FieldFilters filters = collectFieldFilters(query);
    SearchResponse response;

    for (const Session& session : store.sessions()) {
        for (const Message& message : store.messages(session.id, 0)) {
            if (!passesFieldFilters(filters, message, session)) {
                continue;
            }
            const std::vector<Target> targets = targetsFor(query.scope, message);
            const std::optional<MatchField> field = matchText(query, targets);
            if (!field.has_value()) {
                continue;
            }

            ++response.total;
            if (response.total > offset && static_cast<int>(response.hits.size()) < limit) {
                SearchHit hit;
                hit.sessionId = message.sessionId;
                hit.messageId = message.id;
                hit.role = message.role;
                hit.type = message.recordType;
                hit.model = message.model;
                hit.source = message.source;
                hit.lineNo = message.lineNo;
                hit.timestamp = message.timestamp;
                hit.field = field.value();
                hit.preview = previewOf(targets, field.value());
                response.hits.push_back(std::move(hit));
            }

            if (m_limits.budgetMs > 0 && timer.elapsed() > m_limits.budgetMs) {
                response.truncated = true;
                break;
            }
        }
        if (response.truncated) {
            break;
        }
    }

    std::sort(response.hits.begin(), response.hits.end(), hitOrder);
    response.tookMs = timer.elapsed();

    LOG_DEBUG(cwSearch, "Search matched %d (%d returned%s) in %lld ms", response.total,
              static_cast<int>(response.hits.size()), response.truncated ? ", truncated" : "",
              static_cast<long long>(response.tookMs));
    return response;
}

} // namespace cw
