#pragma once

#include "core/query/compiled_query.h"

#include <QString>

namespace cw {

// Compiles the user-facing query language:
//
//   term            case-insensitive substring
//   "some phrase"   substring including spaces
//   -x              excludes x (any form below)
//   foo*            prefix; any other '*' turns the token into a wildcard regex
//   /re/i           regex literal, only the i flag is honoured
//   field:value     role, type, model, cwd, cwd_base metadata filter
//   in:tools        scope override (content / tools / all)
//   a OR b          top-level disjunction (exact, upper case)
//
// Never fails: an invalid regex compiles to a never-matching clause.
class QueryParser {
public:
    static CompiledQuery parse(const QString& rawQuery, const QString& scopeHint = QString());

    // \S \D \W \s \d \w to explicit character classes, after collapsing
    // doubled backslashes.
    static QString rewriteShorthands(const QString& pattern);

    // Metadata filter names; in: is handled separately as a scope override.
    static bool isKnownField(const QString& field);
};

} // namespace cw
