#include "core/index/session_metadata.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

namespace cw {

namespace {

const QString kCustomTitleKey = QStringLiteral("custom_title");

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

QString SessionMetadataStore::sidecarPathFor(const QString& transcriptPath)
{
    const QFileInfo info(transcriptPath);
    return info.dir().filePath(info.completeBaseName() + QStringLiteral(".meta.json"));
}

std::optional<SessionMetadata> SessionMetadataStore::load(const QString& sidecarPath)
{
    QFile file(sidecarPath);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(cwIndex, "Failed to open session metadata: %s", qUtf8Printable(sidecarPath));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(cwIndex, "Ignoring malformed session metadata %s: %s",
                 qUtf8Printable(sidecarPath), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    SessionMetadata metadata;
    metadata.customTitle = doc.object().value(kCustomTitleKey).toString();
    if (metadata.customTitle.trimmed().isEmpty()) {
        return std::nullopt;
    }
    return metadata;
}

bool SessionMetadataStore::save(const QString& sidecarPath, const SessionMetadata& metadata,
                                QString* errorOut)
{
    const QString parentDir = QFileInfo(sidecarPath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        setError(errorOut, QStringLiteral("cannot create directory %1").arg(parentDir));
        return false;
    }

    QJsonObject json;
    json.insert(kCustomTitleKey, metadata.customTitle);
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Indented);

    QSaveFile file(sidecarPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorOut, QStringLiteral("cannot open %1: %2").arg(sidecarPath, file.errorString()));
        return false;
    }
    if (file.write(payload) != payload.size() || !file.commit()) {
        setError(errorOut, QStringLiteral("cannot write %1: %2").arg(sidecarPath, file.errorString()));
        return false;
    }
    return true;
}

bool SessionMetadataStore::remove(const QString& sidecarPath, QString* errorOut)
{
    QFile file(sidecarPath);
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        setError(errorOut, QStringLiteral("cannot remove %1: %2").arg(sidecarPath, file.errorString()));
        return false;
    }
    return true;
}

} // namespace cw
