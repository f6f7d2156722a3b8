#include "core/fs/session_scanner.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <utility>

namespace cw {

SessionScanner::SessionScanner(ProviderRoots roots)
    : m_roots(std::move(roots))
{
}

std::vector<SessionFile> SessionScanner::discover() const
{
    std::vector<SessionFile> results;

    // ── Codex: <codexDir>/sessions/**/*.jsonl ────────────────────
    if (!m_roots.codexDir.trimmed().isEmpty()) {
        const QString sessionsDir = QDir(m_roots.codexDir).filePath(QStringLiteral("sessions"));
        if (QFileInfo(sessionsDir).isDir()) {
            std::vector<QString> paths;
            collectJsonl(sessionsDir, paths);
            for (const QString& path : paths) {
                const QFileInfo fi(path);
                SessionFile file;
                file.provider = Provider::Codex;
                file.sessionKey = fi.completeBaseName().isEmpty() ? fi.fileName()
                                                                   : fi.completeBaseName();
                file.path = path;
                file.source = relativeSource(m_roots.codexDir, path);
                results.push_back(std::move(file));
            }
        } else {
            LOG_DEBUG(cwFs, "Codex sessions directory missing: %s", qUtf8Printable(sessionsDir));
        }
    }

    // ── Claude: <claudeDir>/<project>/**/*.jsonl ─────────────────
    if (!m_roots.claudeDir.trimmed().isEmpty()) {
        const QDir claudeRoot(m_roots.claudeDir);
        if (claudeRoot.exists()) {
            const QFileInfoList projects = claudeRoot.entryInfoList(
                QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
            for (const QFileInfo& projectInfo : projects) {
                const QString project = projectInfo.fileName();
                std::vector<QString> paths;
                collectJsonl(projectInfo.absoluteFilePath(), paths);
                for (const QString& path : paths) {
                    const QFileInfo fi(path);
                    SessionFile file;
                    file.provider = Provider::Claude;
                    file.project = project;
                    file.sessionKey = claudeSessionKey(project, fi.completeBaseName());
                    file.path = path;
                    file.source = relativeSource(m_roots.claudeDir, path);
                    results.push_back(std::move(file));
                }
            }
        } else {
            LOG_DEBUG(cwFs, "Claude projects directory missing: %s",
                      qUtf8Printable(m_roots.claudeDir));
        }
    }

    std::sort(results.begin(), results.end(),
              [](const SessionFile& a, const SessionFile& b) { return a.path < b.path; });
    return results;
}

QString SessionScanner::claudeSessionKey(const QString& project, const QString& stem)
{
    return QStringLiteral("claude:%1:%2").arg(project, stem);
}

QString SessionScanner::relativeSource(const QString& root, const QString& path)
{
    if (root.trimmed().isEmpty()) {
        return path;
    }
    const QString relative = QDir(root).relativeFilePath(path);
    if (relative.startsWith(QLatin1String("../")) || QDir::isAbsolutePath(relative)) {
        return path;
    }
    return relative;
}

void SessionScanner::collectJsonl(const QString& dirPath,
                                  std::vector<QString>& out,
                                  int depth) const
{
    if (depth >= kMaxDepth) {
        LOG_WARN(cwFs, "Max scan depth (%d) reached at: %s", kMaxDepth,
                 qUtf8Printable(dirPath));
        return;
    }

    const QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);

    for (const QFileInfo& fi : entries) {
        if (fi.isDir()) {
            // Symlinked directories can form cycles.
            if (fi.isSymLink()) {
                continue;
            }
            collectJsonl(fi.absoluteFilePath(), out, depth + 1);
            continue;
        }
        if (isTranscriptFile(fi.fileName())) {
            out.push_back(fi.absoluteFilePath());
        }
    }
}

bool SessionScanner::isTranscriptFile(const QString& fileName)
{
    return fileName.endsWith(QLatin1String(".jsonl"), Qt::CaseInsensitive);
}

} // namespace cw
