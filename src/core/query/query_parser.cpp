#include "core/query/query_parser.h"
#include "core/shared/logging.h"

#include <QSet>

namespace cw {

namespace {

struct Token {
    QString raw;
    bool negative = false;
    bool isOr = false;
    bool isField = false;
    QString field;
};

bool isSpace(QChar ch)
{
    return ch == QLatin1Char(' ') || ch == QLatin1Char('\t')
        || ch == QLatin1Char('\n') || ch == QLatin1Char('\r');
}

bool isAsciiLetter(QChar ch)
{
    return (ch >= QLatin1Char('a') && ch <= QLatin1Char('z'))
        || (ch >= QLatin1Char('A') && ch <= QLatin1Char('Z'));
}

QString stripQuotes(const QString& s)
{
    if (s.size() >= 2 && s.startsWith(QLatin1Char('"')) && s.endsWith(QLatin1Char('"'))) {
        return s.mid(1, s.size() - 2);
    }
    return s;
}

std::vector<Token> tokenize(const QString& input)
{
    std::vector<Token> tokens;
    const QString s = input.trimmed();
    const int n = s.size();
    int i = 0;

    while (i < n) {
        if (isSpace(s.at(i))) {
            ++i;
            continue;
        }

        Token token;
        if (s.at(i) == QLatin1Char('-')) {
            token.negative = true;
            ++i;
            while (i < n && isSpace(s.at(i))) {
                ++i;
            }
        }
        if (i >= n) {
            break;
        }

        // "phrase" up to the closing quote (or end of input)
        if (s.at(i) == QLatin1Char('"')) {
            int j = i + 1;
            while (j < n && s.at(j) != QLatin1Char('"')) {
                ++j;
            }
            token.raw = QLatin1Char('"') + s.mid(i + 1, j - i - 1) + QLatin1Char('"');
            tokens.push_back(token);
            i = qMin(j + 1, n);
            continue;
        }

        // /pattern/flags
        if (s.at(i) == QLatin1Char('/')) {
            int j = i + 1;
            while (j < n && s.at(j) != QLatin1Char('/')) {
                ++j;
            }
            int k = j + 1;
            while (k < n && isAsciiLetter(s.at(k))) {
                ++k;
            }
            k = qMin(k, n);
            token.raw = s.mid(i, k - i);
            tokens.push_back(token);
            i = k;
            continue;
        }

        int j = i;
        while (j < n && !isSpace(s.at(j))) {
            ++j;
        }
        const QString raw = s.mid(i, j - i);
        i = j;

        if (raw == QLatin1String("OR")) {
            Token orToken;
            orToken.isOr = true;
            tokens.push_back(orToken);
            continue;
        }

        const int colon = raw.indexOf(QLatin1Char(':'));
        if (colon > 0) {
            const QString field = raw.left(colon).toLower();
            if (QueryParser::isKnownField(field) || field == QLatin1String("in")) {
                token.isField = true;
                token.field = field;
                token.raw = raw.mid(colon + 1);
                tokens.push_back(token);
                continue;
            }
        }

        token.raw = raw;
        tokens.push_back(token);
    }
    return tokens;
}

Clause regexClause(const QString& pattern, QRegularExpression::PatternOptions options,
                   bool negative)
{
    Clause clause;
    clause.negative = negative;
    clause.value = pattern;
    QRegularExpression regex(pattern, options);
    if (regex.isValid()) {
        clause.kind = Clause::Kind::Regex;
        clause.regex = regex;
    } else {
        clause.kind = Clause::Kind::NeverMatch;
        LOG_DEBUG(cwSearch, "Regex clause never matches (%s): %s",
                  qUtf8Printable(regex.errorString()), qUtf8Printable(pattern));
    }
    return clause;
}

Clause compileTextToken(const Token& token)
{
    const QString& raw = token.raw;

    if (raw.startsWith(QLatin1Char('/')) && raw.size() >= 2) {
        QString pattern = raw;
        QString flags;
        const int closing = raw.lastIndexOf(QLatin1Char('/'));
        if (closing > 0) {
            pattern = raw.mid(1, closing - 1);
            flags = raw.mid(closing + 1);
        }
        QRegularExpression::PatternOptions options = QRegularExpression::NoPatternOption;
        if (flags.contains(QLatin1Char('i'))) {
            options |= QRegularExpression::CaseInsensitiveOption;
        }
        return regexClause(QueryParser::rewriteShorthands(pattern), options, token.negative);
    }

    Clause clause;
    clause.negative = token.negative;

    if (raw.size() >= 2 && raw.startsWith(QLatin1Char('"')) && raw.endsWith(QLatin1Char('"'))) {
        clause.kind = Clause::Kind::Phrase;
        clause.value = stripQuotes(raw).toLower();
        return clause;
    }

    if (raw.contains(QLatin1Char('*'))) {
        if (raw.count(QLatin1Char('*')) == 1 && raw.endsWith(QLatin1Char('*'))) {
            clause.kind = Clause::Kind::Prefix;
            clause.value = raw.left(raw.size() - 1).toLower();
            return clause;
        }
        QString pattern = QRegularExpression::escape(raw);
        pattern.replace(QStringLiteral("\\*"), QStringLiteral(".*"));
        return regexClause(pattern, QRegularExpression::CaseInsensitiveOption, token.negative);
    }

    clause.kind = Clause::Kind::Term;
    clause.value = raw.toLower();
    return clause;
}

} // namespace

Scope scopeFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("tools")) {
        return Scope::Tools;
    }
    if (normalized == QLatin1String("all")) {
        return Scope::All;
    }
    return Scope::Content;
}

QString scopeToString(Scope scope)
{
    switch (scope) {
    case Scope::Content: return QStringLiteral("content");
    case Scope::Tools:   return QStringLiteral("tools");
    case Scope::All:     return QStringLiteral("all");
    }
    return QStringLiteral("content");
}

CompiledQuery QueryParser::parse(const QString& rawQuery, const QString& scopeHint)
{
    CompiledQuery query;
    query.scope = scopeFromString(scopeHint);

    ClauseGroup current;
    for (const Token& token : tokenize(rawQuery)) {
        if (token.isOr) {
            if (!current.empty()) {
                query.groups.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        if (token.isField) {
            if (token.field == QLatin1String("in")) {
                // Scope override; contributes no clause.
                query.scope = scopeFromString(stripQuotes(token.raw));
                continue;
            }
            Clause clause;
            clause.kind = Clause::Kind::Field;
            clause.negative = token.negative;
            clause.field = token.field;
            clause.value = stripQuotes(token.raw);
            current.push_back(clause);
            continue;
        }
        current.push_back(compileTextToken(token));
    }
    if (!current.empty()) {
        query.groups.push_back(std::move(current));
    }
    if (query.groups.empty()) {
        query.groups.emplace_back();
    }
    return query;
}

QString QueryParser::rewriteShorthands(const QString& pattern)
{
    QString out = pattern;
    // Users often paste shell-escaped patterns such as \\s.
    out.replace(QStringLiteral("\\\\"), QStringLiteral("\\"));
    // Upper-case forms first so their replacements are not rewritten again.
    out.replace(QStringLiteral("\\S"), QStringLiteral("[^[:space:]]"));
    out.replace(QStringLiteral("\\D"), QStringLiteral("[^0-9]"));
    out.replace(QStringLiteral("\\W"), QStringLiteral("[^A-Za-z0-9_]"));
    out.replace(QStringLiteral("\\s"), QStringLiteral("[[:space:]]"));
    out.replace(QStringLiteral("\\d"), QStringLiteral("[0-9]"));
    out.replace(QStringLiteral("\\w"), QStringLiteral("[A-Za-z0-9_]"));
    return out;
}

bool QueryParser::isKnownField(const QString& field)
{
    static const QSet<QString> kFields = {
        QStringLiteral("role"),
        QStringLiteral("type"),
        QStringLiteral("model"),
        QStringLiteral("cwd"),
        QStringLiteral("cwd_base"),
    };
    return kFields.contains(field);
}

} // namespace cw
