#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

namespace cw {

// Assistant tool whose transcript schema a record was parsed from.
enum class Provider {
    Codex,
    Claude,
};

QString providerToString(Provider provider);
std::optional<Provider> providerFromString(const QString& str);

// One normalized transcript event.
struct Message {
    QString id;                         // provider-supplied, may be empty
    QString sessionId;
    std::optional<QDateTime> timestamp;
    QString role;                       // user / assistant / system / empty
    QString content;                    // human-readable text only
    QString thinking;                   // chain-of-thought parts, never merged into content
    QString model;
    QString recordType;                 // message / reasoning / function_call / ...
    QString toolName;
    QString cwd;                        // working directory revealed by this record, if any
    QJsonObject raw;                    // original record, verbatim
    QString source;                     // path relative to the provider root
    Provider provider = Provider::Codex;
    int lineNo = 0;                     // 1-based physical line within source
};

// Aggregate of all messages sharing one session key.
struct Session {
    QString id;
    QString title;
    bool customTitle = false;           // title came from a persisted override
    QDateTime firstAt;
    QDateTime lastAt;
    QDateTime fileModAt;
    int messageCount = 0;
    int textCount = 0;
    QString cwd;
    QString cwdBase;
    QMap<QString, int> models;
    QMap<QString, int> roles;
    QStringList sources;                // sorted, unique
    Provider provider = Provider::Codex;
    QString project;
};

struct IndexStats {
    int totalMessages = 0;
    int totalSessions = 0;
    QMap<QString, int> byRole;
    QMap<QString, int> byModel;
    QMap<QString, int> fields;          // observed top-level record keys
    int badLines = 0;
    int filesScanned = 0;
    qint64 lastScanMs = 0;
};

QJsonObject messageToJson(const Message& message);
QJsonObject sessionToJson(const Session& session);
QJsonObject indexStatsToJson(const IndexStats& stats);

} // namespace cw
