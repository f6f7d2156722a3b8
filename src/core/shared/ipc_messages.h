#pragma once

#include <QString>

namespace cw {

// Error codes carried in the "error" object of an IPC error envelope.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    NotFound           = 4,
    InternalError      = 6,
    Unsupported        = 7,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams: return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:      return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::InternalError: return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:   return QStringLiteral("UNSUPPORTED");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace cw
