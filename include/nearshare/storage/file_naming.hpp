#pragma once

#include <string>
#include <string_view>
#include <cstddef>

namespace nearshare::storage {

constexpr std::size_t MAX_FILE_NAME_BYTES = 255;
constexpr std::string_view PLACEHOLDER_FILE_NAME = "unnamed_file";
constexpr std::string_view FORBIDDEN_NAME_CHARACTERS = "/\\:*?\"<>|";

// Replaces forbidden characters with '_', trims whitespace, caps the result at
// MAX_FILE_NAME_BYTES without splitting a UTF-8 sequence and falls back to
// PLACEHOLDER_FILE_NAME when nothing usable is left. sanitize(sanitize(x)) == sanitize(x).
std::string sanitize_file_name(std::string_view name);

bool is_safe_file_name(std::string_view name);

} // namespace nearshare::storage
