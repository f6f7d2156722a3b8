#include "core/indexing/session_aggregator.h"
#include "core/indexing/record_fields.h"

#include <QRegularExpression>
#include <QVector>

#include <algorithm>

namespace cw {

namespace {

bool isSummaryRecord(const Message& message)
{
    return message.provider == Provider::Claude
        && message.recordType.compare(QLatin1String("summary"), Qt::CaseInsensitive) == 0;
}

void addSource(Session& session, const QString& source)
{
    if (source.isEmpty()) {
        return;
    }
    const auto it = std::lower_bound(session.sources.begin(), session.sources.end(), source);
    if (it != session.sources.end() && *it == source) {
        return;
    }
    session.sources.insert(it, source);
}

} // namespace

void SessionAggregator::apply(Session& session, const Message& message)
{
    // cwd first: the fallback title may depend on it.
    if (session.cwd.isEmpty() && !message.cwd.trimmed().isEmpty()) {
        session.cwd = message.cwd;
        session.cwdBase = cwdBase(message.cwd);
    }

    if (!session.customTitle && isSummaryRecord(message)) {
        const QString summary = records::stringValue(message.raw.value(QStringLiteral("summary")));
        if (!summary.trimmed().isEmpty()) {
            session.title = trimTitle(summary);
        }
    }

    if (session.title.isEmpty()) {
        QString title = normalizeTitleCandidate(
            records::stringValue(message.raw.value(QStringLiteral("title"))), session);
        if (title.isEmpty()) {
            title = normalizeTitleCandidate(message.content, session);
        }
        if (title.isEmpty()) {
            title = trimTitle(fallbackTitle(session));
        }
        session.title = title;
    }

    ++session.messageCount;
    if (!message.content.trimmed().isEmpty()) {
        ++session.textCount;
    }

    if (message.timestamp.has_value()) {
        const QDateTime& ts = message.timestamp.value();
        if (!session.firstAt.isValid() || ts < session.firstAt) {
            session.firstAt = ts;
        }
        if (!session.lastAt.isValid() || ts > session.lastAt) {
            session.lastAt = ts;
        }
    }

    if (!message.model.isEmpty()) {
        ++session.models[message.model];
    }
    if (!message.role.isEmpty()) {
        ++session.roles[message.role];
    }
    addSource(session, message.source);
}

QString SessionAggregator::trimTitle(const QString& text)
{
    QString title = text;
    title.replace(QLatin1Char('\n'), QLatin1Char(' '));
    title = title.trimmed();

    const QVector<uint> codePoints = title.toUcs4();
    if (codePoints.size() <= kMaxTitleLength) {
        return title;
    }
    return QString::fromUcs4(reinterpret_cast<const char32_t*>(codePoints.constData()),
                             kMaxTitleLength)
        + QChar(0x2026);
}

QString SessionAggregator::normalizeTitleCandidate(const QString& candidate, const Session& session)
{
    const QString trimmed = candidate.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    if (trimmed.compare(session.id.trimmed(), Qt::CaseInsensitive) == 0) {
        return {};
    }
    if (looksLikeEnvironmentContext(trimmed) || looksLikeGeneratedIdentifier(trimmed)) {
        return {};
    }
    return trimTitle(trimmed);
}

bool SessionAggregator::looksLikeEnvironmentContext(const QString& text)
{
    if (text.isEmpty()) {
        return false;
    }
    const QString lower = text.toLower();
    if (lower.contains(QLatin1String("<environment_context"))) {
        return true;
    }

    static const char* const kMarkers[] = {
        "<cwd>", "</cwd>", "<approval_pol", "<sandbox_mode", "<network_access", "<shell>",
    };
    int hits = 0;
    for (const char* marker : kMarkers) {
        if (lower.contains(QLatin1String(marker))) {
            ++hits;
        }
    }
    return hits >= 2;
}

bool SessionAggregator::looksLikeGeneratedIdentifier(const QString& text)
{
    const QString lower = text.trimmed().toLower();
    if (lower.isEmpty()) {
        return false;
    }
    // <word>-YYYY-MM-DDtHH-MM-SS-<hash segments>, e.g. rollout file stems.
    static const QRegularExpression kGenerated(QStringLiteral(
        "^[a-z]+-\\d{4}-\\d{2}-\\d{2}t\\d{2}-\\d{2}-\\d{2}(?:-[0-9a-z]+)+$"));
    if (kGenerated.match(lower).hasMatch()) {
        return true;
    }
    return lower.startsWith(QLatin1String("rollout-"));
}

QString SessionAggregator::fallbackTitle(const Session& session)
{
    const QString base = session.cwdBase.trimmed();
    if (!base.isEmpty()) {
        return base;
    }
    const QString cwd = session.cwd.trimmed();
    if (!cwd.isEmpty()) {
        return cwd;
    }
    const QString id = session.id.trimmed();
    if (!id.isEmpty() && !looksLikeGeneratedIdentifier(id)) {
        return id;
    }
    return {};
}

QString SessionAggregator::cwdBase(const QString& cwd)
{
    QString trimmed = cwd;
    while (trimmed.endsWith(QLatin1Char('/'))) {
        trimmed.chop(1);
    }
    if (trimmed.isEmpty()) {
        return {};
    }
    const int slash = trimmed.lastIndexOf(QLatin1Char('/'));
    return slash < 0 ? trimmed : trimmed.mid(slash + 1);
}

} // namespace cw
