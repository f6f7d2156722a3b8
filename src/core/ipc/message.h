#pragma once

#include "core/shared/ipc_messages.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace cw {

// IpcMessage -- framing and envelopes for the local-socket protocol.
//
// Frame: 4-byte big-endian payload length, then compact UTF-8 JSON object.
// Request:  {"type":"request","id":N,"method":"...","params":{...}}
// Response: {"type":"response","id":N,"result":{...}}
// Error:    {"type":"error","id":N,"error":{"code":C,"codeString":"...","message":"..."}}
class IpcMessage {
public:
    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxPayloadSize = 16 * 1024 * 1024;

    // Empty when the payload would exceed kMaxPayloadSize.
    static QByteArray encode(const QJsonObject& json);

    struct Frame {
        enum class Status {
            Incomplete,   // wait for more bytes
            Ok,
            Malformed,    // oversized length or non-object payload; drop the peer
        };
        Status status = Status::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static Frame decode(const QByteArray& buffer);

    static QJsonObject makeRequest(qint64 id, const QString& method,
                                   const QJsonObject& params = {});
    static QJsonObject makeResponse(qint64 id, const QJsonObject& result);
    static QJsonObject makeError(qint64 id, IpcErrorCode code, const QString& message);

    static qint64 requestId(const QJsonObject& request);
};

} // namespace cw
