#pragma once

#include "core/shared/settings.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QTemporaryDir>

namespace cw::test {

// Temporary home with a Codex root (<tmp>/codex/sessions) and a Claude
// projects root (<tmp>/claude) laid out like the real tools write them.
class TranscriptFixture {
public:
    TranscriptFixture();

    bool isValid() const;
    QString path() const { return m_dir.path(); }
    QString codexDir() const;
    QString claudeDir() const;

    // Settings pointing at this fixture's roots.
    Settings settings() const;

    // <codexDir>/sessions/<relativePath>, parents created.
    QString codexFile(const QString& relativePath) const;
    // <claudeDir>/<project>/<fileName>, parents created.
    QString claudeFile(const QString& project, const QString& fileName) const;

private:
    QTemporaryDir m_dir;
};

// Sets an environment variable for the lifetime of the object.
class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value);
    ~ScopedEnvVar();

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    const char* key_ = nullptr;
    QByteArray oldValue_;
    bool hadValue_ = false;
};

QByteArray jsonLine(const QJsonObject& record);
bool writeFile(const QString& path, const QByteArray& contents);
bool appendToFile(const QString& path, const QByteArray& contents);
QByteArray readFile(const QString& path);
int countLines(const QString& path);

} // namespace cw::test
