#pragma once

#include <QRegularExpression>
#include <QString>

#include <vector>

namespace cw {

// Which text of a message free-text clauses are tested against.
enum class Scope {
    Content,    // extracted message content
    Tools,      // tool command line, stdout, stderr
    All,        // content first, then tool text
};

// "tools" and "all" (case-insensitive, trimmed); anything else is Content.
Scope scopeFromString(const QString& str);
QString scopeToString(Scope scope);

struct Clause {
    enum class Kind {
        Term,         // case-insensitive substring
        Phrase,       // quoted; case-insensitive substring
        Prefix,       // foo* ; substring of the part before '*'
        Regex,        // /re/flags or interior-wildcard token
        NeverMatch,   // regex that failed to compile
        Field,        // role / type / model / cwd / cwd_base metadata filter
    };

    Kind kind = Kind::Term;
    bool negative = false;
    QString field;              // Field only
    QString value;              // text value, lowercased for text kinds
    QRegularExpression regex;   // Regex only, always valid
};

using ClauseGroup = std::vector<Clause>;

// Disjunction of AND-groups. An empty query is one empty group.
struct CompiledQuery {
    Scope scope = Scope::Content;
    std::vector<ClauseGroup> groups;
};

} // namespace cw
