#include "nearshare/core/transfer_error.hpp"

namespace nearshare::core {

std::string_view to_string(TransferErrorKind kind) {
    switch (kind) {
        case TransferErrorKind::PERMISSION_DENIED: return "PermissionDenied";
        case TransferErrorKind::PEER_NOT_FOUND: return "PeerNotFound";
        case TransferErrorKind::CONNECTION_FAILED: return "ConnectionFailed";
        case TransferErrorKind::CONNECTION_LOST: return "ConnectionLost";
        case TransferErrorKind::FILE_IO_ERROR: return "FileIOError";
        case TransferErrorKind::TIMEOUT: return "Timeout";
        case TransferErrorKind::UNSUPPORTED_OPERATION: return "UnsupportedOperation";
        case TransferErrorKind::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string TransferError::describe() const {
    std::string text = std::string(to_string(kind)) + ": " + message;
    if (cause && !cause->empty()) {
        text += " (" + *cause + ")";
    }
    return text;
}

TransferError TransferError::permission_denied(std::string msg) {
    return TransferError(TransferErrorKind::PERMISSION_DENIED, std::move(msg));
}

TransferError TransferError::peer_not_found(std::string msg) {
    return TransferError(TransferErrorKind::PEER_NOT_FOUND, std::move(msg));
}

TransferError TransferError::connection_failed(std::string msg, std::optional<std::string> cause) {
    return TransferError(TransferErrorKind::CONNECTION_FAILED, std::move(msg), std::move(cause));
}

TransferError TransferError::connection_lost(std::string msg, std::optional<std::string> cause) {
    return TransferError(TransferErrorKind::CONNECTION_LOST, std::move(msg), std::move(cause));
}

TransferError TransferError::file_io(std::string msg, std::optional<std::string> cause) {
    return TransferError(TransferErrorKind::FILE_IO_ERROR, std::move(msg), std::move(cause));
}

TransferError TransferError::timeout(std::string msg) {
    return TransferError(TransferErrorKind::TIMEOUT, std::move(msg));
}

TransferError TransferError::unsupported(std::string msg) {
    return TransferError(TransferErrorKind::UNSUPPORTED_OPERATION, std::move(msg));
}

TransferError TransferError::unknown(std::string msg, std::optional<std::string> cause) {
    return TransferError(TransferErrorKind::UNKNOWN, std::move(msg), std::move(cause));
}

} // namespace nearshare::core
