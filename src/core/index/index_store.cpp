#include "core/index/index_store.h"
#include "core/fs/tailer.h"
#include "core/index/session_metadata.h"
#include "core/indexing/record_normalizer.h"
#include "core/indexing/session_aggregator.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include <algorithm>
#include <mutex>

namespace cw {

namespace {

void addCount(QMap<QString, int>& histogram, const QString& key, int delta)
{
    if (key.isEmpty()) {
        return;
    }
    auto it = histogram.find(key);
    if (it == histogram.end()) {
        if (delta > 0) {
            histogram.insert(key, delta);
        }
        return;
    }
    it.value() += delta;
    if (it.value() <= 0) {
        histogram.erase(it);
    }
}

void subtractHistogram(QMap<QString, int>& histogram, const QMap<QString, int>& amounts)
{
    for (auto it = amounts.cbegin(); it != amounts.cend(); ++it) {
        addCount(histogram, it.key(), -it.value());
    }
}

QString cleanRoot(const QString& dir)
{
    if (dir.trimmed().isEmpty()) {
        return {};
    }
    return QDir::cleanPath(QDir(dir).absolutePath());
}

bool lastAtDescending(const Session& a, const Session& b)
{
    if (a.lastAt.isValid() != b.lastAt.isValid()) {
        return a.lastAt.isValid();
    }
    if (a.lastAt != b.lastAt) {
        return a.lastAt > b.lastAt;
    }
    return a.id < b.id;
}

// Id the normalizer gives one raw transcript line; empty when it yields none.
QString recordIdOf(Provider provider, const QByteArray& bytes)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {};
    }
    RecordContext context;
    context.provider = provider;
    const std::optional<Message> message = normalizerFor(provider).normalize(context, doc.object());
    return message.has_value() ? message->id : QString();
}

// Rewrite path without its 1-based physical line lineNo, which must still hold
// messageId; otherwise *drifted is set and the file is left alone. QSaveFile
// stages the result in a temporary beside the original and renames it into
// place; an uncommitted temporary is discarded.
bool removeLineFromFile(const QString& path, int lineNo, Provider provider,
                        const QString& messageId, QString* errorOut, bool* drifted)
{
    *drifted = false;
    QFile input(path);
    if (!input.open(QIODevice::ReadOnly)) {
        *errorOut = QStringLiteral("cannot open %1: %2").arg(path, input.errorString());
        return false;
    }
    const QByteArray contents = input.readAll();
    input.close();

    QByteArray rewritten;
    rewritten.reserve(contents.size());
    bool removed = false;
    int currentLine = 0;
    qsizetype start = 0;
    while (start < contents.size()) {
        qsizetype end = contents.indexOf('\n', start);
        end = (end < 0) ? contents.size() : end + 1;
        ++currentLine;
        if (currentLine == lineNo) {
            const QByteArray text(contents.constData() + start, end - start);
            if (recordIdOf(provider, text) != messageId) {
                *drifted = true;
                *errorOut = QStringLiteral("line %1 of %2 no longer holds message %3")
                                .arg(lineNo)
                                .arg(path, messageId);
                return false;
            }
            removed = true;
        } else {
            rewritten.append(contents.constData() + start, end - start);
        }
        start = end;
    }
    if (!removed) {
        *errorOut = QStringLiteral("line %1 not present in %2").arg(lineNo).arg(path);
        return false;
    }

    QSaveFile output(path);
    if (!output.open(QIODevice::WriteOnly)) {
        *errorOut = QStringLiteral("cannot open %1 for rewrite: %2").arg(path, output.errorString());
        return false;
    }
    if (output.write(rewritten) != rewritten.size()) {
        *errorOut = QStringLiteral("cannot write %1: %2").arg(path, output.errorString());
        output.cancelWriting();
        return false;
    }
    if (!output.commit()) {
        *errorOut = QStringLiteral("cannot replace %1: %2").arg(path, output.errorString());
        return false;
    }
    return true;
}

} // namespace

IndexStore::IndexStore(const Settings& settings)
    : m_roots{cleanRoot(settings.codexDir), cleanRoot(settings.claudeDir)}
    , m_maxMessagesPerSession(settings.maxMessagesPerSession)
{
}

// ── Reads ───────────────────────────────────────────────────

std::vector<Session> IndexStore::sessions() const
{
    std::vector<Session> out;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        out.reserve(static_cast<size_t>(m_sessions.size()));
        for (auto it = m_sessions.cbegin(); it != m_sessions.cend(); ++it) {
            out.push_back(it.value());
        }
    }
    std::sort(out.begin(), out.end(), lastAtDescending);
    return out;
}

std::optional<Session> IndexStore::session(const QString& sessionId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_sessions.constFind(sessionId);
    if (it == m_sessions.cend()) {
        return std::nullopt;
    }
    return it.value();
}

bool IndexStore::hasSession(const QString& sessionId) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_sessions.contains(sessionId);
}

std::vector<Message> IndexStore::messages(const QString& sessionId, int limit) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_messages.constFind(sessionId);
    if (it == m_messages.cend()) {
        return {};
    }
    const std::deque<Message>& all = it.value();
    auto first = all.cbegin();
    if (limit > 0 && static_cast<size_t>(limit) < all.size()) {
        first = all.cend() - limit;
    }
    return std::vector<Message>(first, all.cend());
}

IndexStats IndexStore::stats() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_stats;
}

// ── Ingestion ───────────────────────────────────────────────

int IndexStore::scanOnce()
{
    QElapsedTimer timer;
    timer.start();

    const std::vector<SessionFile> files = SessionScanner(m_roots).discover();
    for (const SessionFile& file : files) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        tailFileLocked(file);
    }

    const int filesScanned = static_cast<int>(files.size());
    const qint64 elapsedMs = timer.elapsed();
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_stats.filesScanned = filesScanned;
        m_stats.lastScanMs = elapsedMs;
    }
    LOG_DEBUG(cwIndex, "Scan visited %d files in %lld ms", filesScanned,
              static_cast<long long>(elapsedMs));
    return filesScanned;
}

void IndexStore::ingestLine(const SessionFile& file, int lineNo, const QByteArray& bytes)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    ingestLocked(file, lineNo, bytes);
}

void IndexStore::tailFileLocked(const SessionFile& file)
{
    const TailBatch batch = Tailer::readFrom(file.path, m_cursors.cursor(file.path));
    if (!batch.ok) {
        return;
    }

    if (batch.startOffset == 0 && m_tallies.contains(file.path)) {
        purgeFileLocked(file.path, file.provider, file.source);
    }

    for (const TailLine& line : batch.lines) {
        ingestLocked(file, line.lineNo, line.bytes);
    }
    m_cursors.advance(file.path, batch.endOffset, batch.endLineNo);

    if (!batch.modifiedAt.isValid()) {
        return;
    }
    const auto tally = m_tallies.constFind(file.path);
    if (tally == m_tallies.cend()) {
        return;
    }
    for (auto it = tally->sessions.cbegin(); it != tally->sessions.cend(); ++it) {
        auto session = m_sessions.find(it.key());
        if (session != m_sessions.end()
            && (!session->fileModAt.isValid() || batch.modifiedAt > session->fileModAt)) {
            session->fileModAt = batch.modifiedAt;
        }
    }
}

void IndexStore::ingestLocked(const SessionFile& file, int lineNo, const QByteArray& bytes)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        ++m_stats.badLines;
        ++m_tallies[file.path].badLines;
        LOG_DEBUG(cwIngest, "Skipping malformed line %d of %s: %s", lineNo,
                  qUtf8Printable(file.source), qUtf8Printable(parseError.errorString()));
        return;
    }

    RecordContext context;
    context.provider = file.provider;
    context.project = file.project;
    context.sessionKey = file.sessionKey;
    context.source = file.source;
    context.lineNo = lineNo;

    std::optional<Message> normalized = normalizerFor(file.provider).normalize(context, doc.object());
    if (!normalized.has_value()) {
        return;
    }
    Message& message = normalized.value();
    if (message.sessionId.isEmpty()) {
        message.sessionId = file.sessionKey;
    }

    Session& session = sessionForLocked(message, file);
    SessionAggregator::apply(session, message);

    Contribution& contribution = m_tallies[file.path].sessions[message.sessionId];
    ++contribution.messages;
    ++m_stats.totalMessages;
    if (!message.content.trimmed().isEmpty()) {
        ++contribution.texts;
    }
    addCount(contribution.roles, message.role, 1);
    addCount(m_stats.byRole, message.role, 1);
    addCount(contribution.models, message.model, 1);
    addCount(m_stats.byModel, message.model, 1);
    for (auto it = message.raw.constBegin(); it != message.raw.constEnd(); ++it) {
        addCount(contribution.fields, it.key(), 1);
        addCount(m_stats.fields, it.key(), 1);
    }

    std::deque<Message>& retained = m_messages[message.sessionId];
    retained.push_back(std::move(message));
    while (m_maxMessagesPerSession > 0
           && retained.size() > static_cast<size_t>(m_maxMessagesPerSession)) {
        retained.pop_front();
    }
    m_stats.totalSessions = static_cast<int>(m_sessions.size());
}

Session& IndexStore::sessionForLocked(const Message& message, const SessionFile& file)
{
    auto it = m_sessions.find(message.sessionId);
    if (it != m_sessions.end()) {
        return it.value();
    }

    Session session;
    session.id = message.sessionId;
    session.provider = file.provider;
    session.project = file.project;

    std::optional<SessionMetadata> metadata =
        SessionMetadataStore::load(SessionMetadataStore::sidecarPathFor(file.path));
    if (!metadata.has_value() && file.provider == Provider::Codex) {
        metadata = SessionMetadataStore::load(
            QDir(m_roots.codexDir).filePath(
                QStringLiteral("sessions/%1.meta.json").arg(message.sessionId)));
    }
    if (metadata.has_value()) {
        session.title = SessionAggregator::trimTitle(metadata->customTitle);
        session.customTitle = true;
    }

    return m_sessions.insert(session.id, session).value();
}

void IndexStore::purgeFileLocked(const QString& path, Provider provider, const QString& source)
{
    const auto tally = m_tallies.find(path);
    if (tally == m_tallies.end()) {
        return;
    }

    for (auto it = tally->sessions.cbegin(); it != tally->sessions.cend(); ++it) {
        const Contribution& contribution = it.value();
        m_stats.totalMessages -= contribution.messages;
        subtractHistogram(m_stats.byRole, contribution.roles);
        subtractHistogram(m_stats.byModel, contribution.models);
        subtractHistogram(m_stats.fields, contribution.fields);

        auto session = m_sessions.find(it.key());
        if (session == m_sessions.end()) {
            continue;
        }
        session->messageCount -= contribution.messages;
        session->textCount -= contribution.texts;
        subtractHistogram(session->roles, contribution.roles);
        subtractHistogram(session->models, contribution.models);
        session->sources.removeAll(source);

        auto retained = m_messages.find(it.key());
        if (retained != m_messages.end()) {
            std::deque<Message>& list = retained.value();
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [&](const Message& m) {
                                          return m.provider == provider && m.source == source;
                                      }),
                       list.end());
        }
    }
    m_stats.badLines -= tally->badLines;
    m_tallies.erase(tally);
    LOG_DEBUG(cwIndex, "Purged contributions of %s for re-read", qUtf8Printable(source));
}

void IndexStore::clearLocked()
{
    m_sessions.clear();
    m_messages.clear();
    m_tallies.clear();
    m_cursors.clear();
    m_stats = IndexStats();
}

// ── Mutations ───────────────────────────────────────────────

void IndexStore::reindex()
{
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        clearLocked();
    }
    LOG_INFO(cwIndex, "Reindex requested; rescanning from scratch");
    const int files = scanOnce();
    LOG_INFO(cwIndex, "Reindex complete: %d files", files);
}

MutationResult IndexStore::deleteSession(const QString& sessionId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    const auto it = m_sessions.constFind(sessionId);
    if (it == m_sessions.cend()) {
        return MutationResult::notFound(QStringLiteral("session not found: %1").arg(sessionId));
    }
    const Session session = it.value();

    for (const QString& source : session.sources) {
        const QString path = absolutePath(session.provider, source);
        QFile file(path);
        if (file.exists() && !file.remove()) {
            const QString error =
                QStringLiteral("cannot remove %1: %2").arg(path, file.errorString());
            LOG_ERROR(cwIndex, "Delete session %s failed: %s", qUtf8Printable(sessionId),
                      qUtf8Printable(error));
            return MutationResult::ioError(error);
        }
    }

    QString sidecarError;
    if (!SessionMetadataStore::remove(metadataPathLocked(session), &sidecarError)) {
        LOG_WARN(cwIndex, "Session metadata left behind: %s", qUtf8Printable(sidecarError));
    }

    for (const QString& source : session.sources) {
        const QString path = absolutePath(session.provider, source);
        purgeFileLocked(path, session.provider, source);
        m_cursors.erase(path);
    }
    m_sessions.remove(sessionId);
    m_messages.remove(sessionId);
    m_stats.totalSessions = static_cast<int>(m_sessions.size());

    LOG_INFO(cwIndex, "Deleted session %s (%lld files)", qUtf8Printable(sessionId),
             static_cast<long long>(session.sources.size()));
    return MutationResult::success();
}

MutationResult IndexStore::deleteMessage(const QString& sessionId, const QString& messageId)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto session = m_sessions.find(sessionId);
    if (session == m_sessions.end()) {
        return MutationResult::notFound(QStringLiteral("session not found: %1").arg(sessionId));
    }
    std::deque<Message>& retained = m_messages[sessionId];
    const auto target = std::find_if(retained.begin(), retained.end(), [&](const Message& m) {
        return !messageId.isEmpty() && m.id == messageId;
    });
    if (target == retained.end()) {
        return MutationResult::notFound(
            QStringLiteral("message %1 not found in session %2").arg(messageId, sessionId));
    }

    const QString path = absolutePath(target->provider, target->source);
    QString error;
    bool drifted = false;
    if (!removeLineFromFile(path, target->lineNo, target->provider, messageId, &error,
                            &drifted)) {
        LOG_ERROR(cwIndex, "Delete message %s failed: %s", qUtf8Printable(messageId),
                  qUtf8Printable(error));
        if (drifted) {
            // The file changed under its cursor; the next pass re-derives line numbers.
            m_cursors.reset(path);
        }
        return MutationResult::ioError(error);
    }

    const bool hasText = !target->content.trimmed().isEmpty();
    --session->messageCount;
    --m_stats.totalMessages;
    if (hasText) {
        --session->textCount;
    }
    addCount(session->roles, target->role, -1);
    addCount(m_stats.byRole, target->role, -1);
    addCount(session->models, target->model, -1);
    addCount(m_stats.byModel, target->model, -1);

    auto tally = m_tallies.find(path);
    if (tally != m_tallies.end()) {
        auto contribution = tally->sessions.find(sessionId);
        if (contribution != tally->sessions.end()) {
            --contribution->messages;
            if (hasText) {
                --contribution->texts;
            }
            addCount(contribution->roles, target->role, -1);
            addCount(contribution->models, target->model, -1);
            for (auto it = target->raw.constBegin(); it != target->raw.constEnd(); ++it) {
                addCount(contribution->fields, it.key(), -1);
                addCount(m_stats.fields, it.key(), -1);
            }
        }
    }

    const int lineNo = target->lineNo;
    retained.erase(target);
    // Line numbers after the removed line shifted; the next pass re-derives them.
    m_cursors.reset(path);

    LOG_INFO(cwIndex, "Deleted message %s (line %d) from session %s", qUtf8Printable(messageId),
             lineNo, qUtf8Printable(sessionId));
    return MutationResult::success();
}

MutationResult IndexStore::updateSessionTitle(const QString& sessionId, const QString& title)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    auto session = m_sessions.find(sessionId);
    if (session == m_sessions.end()) {
        return MutationResult::notFound(QStringLiteral("session not found: %1").arg(sessionId));
    }
    // A blank override would not survive the next load of the sidecar.
    if (title.trimmed().isEmpty()) {
        return MutationResult::invalidArgument(QStringLiteral("session title must not be blank"));
    }

    SessionMetadata metadata;
    metadata.customTitle = SessionAggregator::trimTitle(title.trimmed());

    QString error;
    if (!SessionMetadataStore::save(metadataPathLocked(session.value()), metadata, &error)) {
        LOG_ERROR(cwIndex, "Retitle of %s failed: %s", qUtf8Printable(sessionId),
                  qUtf8Printable(error));
        return MutationResult::ioError(error);
    }

    session->title = metadata.customTitle;
    session->customTitle = true;
    LOG_INFO(cwIndex, "Session %s retitled", qUtf8Printable(sessionId));
    return MutationResult::success();
}

// ── Paths ───────────────────────────────────────────────────

QString IndexStore::absolutePath(Provider provider, const QString& source) const
{
    if (QDir::isAbsolutePath(source)) {
        return source;
    }
    const QString& root = (provider == Provider::Claude) ? m_roots.claudeDir : m_roots.codexDir;
    return QDir(root).filePath(source);
}

QString IndexStore::metadataPathLocked(const Session& session) const
{
    if (!session.sources.isEmpty()) {
        return SessionMetadataStore::sidecarPathFor(
            absolutePath(session.provider, session.sources.first()));
    }
    if (session.provider == Provider::Claude) {
        // claude:<project>:<stem>
        const QStringList parts = session.id.split(QLatin1Char(':'));
        if (parts.size() >= 3) {
            return QDir(m_roots.claudeDir)
                .filePath(QStringLiteral("%1/%2.meta.json")
                              .arg(parts.at(1), parts.mid(2).join(QLatin1Char(':'))));
        }
    }
    return QDir(m_roots.codexDir)
        .filePath(QStringLiteral("sessions/%1.meta.json").arg(session.id));
}

} // namespace cw
