#pragma once

#include "nearshare/storage/file_naming.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace nearshare::storage {

constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

// Opaque reference to user-selected content; the content resolver gives it meaning.
using ResourceHandle = std::string;

struct TransferableFile {
    ResourceHandle handle;
    std::string name;
    std::int64_t size_bytes = 0;
    std::optional<std::string> mime_type;

    std::string safe_name() const { return sanitize_file_name(name); }
    std::string mime_or_default() const {
        return mime_type && !mime_type->empty() ? *mime_type : DEFAULT_MIME_TYPE;
    }
};

} // namespace nearshare::storage
