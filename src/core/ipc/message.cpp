#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QtEndian>

#include <cstring>

namespace cw {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxPayloadSize) {
        LOG_WARN(cwIpc, "Refusing to encode %lld byte payload (max %d)",
                 static_cast<long long>(payload.size()), kMaxPayloadSize);
        return {};
    }

    const quint32 length = qToBigEndian(static_cast<quint32>(payload.size()));
    QByteArray frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.append(reinterpret_cast<const char*>(&length), kHeaderSize);
    frame.append(payload);
    return frame;
}

IpcMessage::Frame IpcMessage::decode(const QByteArray& buffer)
{
    Frame frame;
    if (buffer.size() < kHeaderSize) {
        return frame;
    }

    quint32 rawLength = 0;
    std::memcpy(&rawLength, buffer.constData(), kHeaderSize);
    const quint32 length = qFromBigEndian(rawLength);
    if (length > static_cast<quint32>(kMaxPayloadSize)) {
        LOG_WARN(cwIpc, "Frame length %u exceeds max %d", length, kMaxPayloadSize);
        frame.status = Frame::Status::Malformed;
        return frame;
    }

    const int total = kHeaderSize + static_cast<int>(length);
    if (buffer.size() < total) {
        return frame;
    }

    QJsonParseError parseError;
    const QJsonDocument doc =
        QJsonDocument::fromJson(buffer.mid(kHeaderSize, static_cast<int>(length)), &parseError);
    frame.bytesConsumed = total;
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(cwIpc, "Discarding frame that is not a JSON object: %s",
                 qUtf8Printable(parseError.errorString()));
        frame.status = Frame::Status::Malformed;
        return frame;
    }

    frame.status = Frame::Status::Ok;
    frame.json = doc.object();
    return frame;
}

QJsonObject IpcMessage::makeRequest(qint64 id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json.insert(QStringLiteral("type"), QStringLiteral("request"));
    json.insert(QStringLiteral("id"), id);
    json.insert(QStringLiteral("method"), method);
    if (!params.isEmpty()) {
        json.insert(QStringLiteral("params"), params);
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(qint64 id, const QJsonObject& result)
{
    QJsonObject json;
    json.insert(QStringLiteral("type"), QStringLiteral("response"));
    json.insert(QStringLiteral("id"), id);
    json.insert(QStringLiteral("result"), result);
    return json;
}

QJsonObject IpcMessage::makeError(qint64 id, IpcErrorCode code, const QString& message)
{
    QJsonObject error;
    error.insert(QStringLiteral("code"), static_cast<int>(code));
    error.insert(QStringLiteral("codeString"), ipcErrorCodeToString(code));
    error.insert(QStringLiteral("message"), message);

    QJsonObject json;
    json.insert(QStringLiteral("type"), QStringLiteral("error"));
    json.insert(QStringLiteral("id"), id);
    json.insert(QStringLiteral("error"), error);
    return json;
}

qint64 IpcMessage::requestId(const QJsonObject& request)
{
    return request.value(QStringLiteral("id")).toInteger();
}

} // namespace cw
