#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace nearshare::core {

enum class TransferErrorKind {
    PERMISSION_DENIED,
    PEER_NOT_FOUND,
    CONNECTION_FAILED,
    CONNECTION_LOST,
    FILE_IO_ERROR,
    TIMEOUT,
    UNSUPPORTED_OPERATION,
    UNKNOWN
};

std::string_view to_string(TransferErrorKind kind);

struct TransferError {
    TransferErrorKind kind;
    std::string message;
    std::optional<std::string> cause;

    TransferError(TransferErrorKind k = TransferErrorKind::UNKNOWN, std::string msg = "",
                  std::optional<std::string> underlying = std::nullopt)
        : kind(k), message(std::move(msg)), cause(std::move(underlying)) {}

    // PERMISSION_DENIED and UNSUPPORTED_OPERATION need outside remediation first.
    bool is_retryable() const {
        return kind != TransferErrorKind::PERMISSION_DENIED &&
               kind != TransferErrorKind::UNSUPPORTED_OPERATION;
    }

    std::string describe() const;

    static TransferError permission_denied(std::string msg = "Required permission not granted");
    static TransferError peer_not_found(std::string msg = "No devices found");
    static TransferError connection_failed(std::string msg = "Failed to connect to device",
                                           std::optional<std::string> cause = std::nullopt);
    static TransferError connection_lost(std::string msg = "Connection lost",
                                         std::optional<std::string> cause = std::nullopt);
    static TransferError file_io(std::string msg = "File operation failed",
                                 std::optional<std::string> cause = std::nullopt);
    static TransferError timeout(std::string msg = "Operation timed out");
    static TransferError unsupported(std::string msg = "Operation not supported on this device");
    static TransferError unknown(std::string msg = "Unknown error",
                                 std::optional<std::string> cause = std::nullopt);
};

} // namespace nearshare::core
