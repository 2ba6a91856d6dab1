#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <cstdint>

namespace nearshare::storage {

struct StorageConfig {
    std::filesystem::path download_directory;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& download_dir);

    bool validate() const;

    bool create_directories() const;

    std::optional<std::uint64_t> get_available_space() const;

    // Unknown free space never blocks a transfer.
    bool has_sufficient_space(std::uint64_t required_bytes) const;

    // First free path for safe_name under download_directory:
    // "name.ext", then "name (1).ext", "name (2).ext", ...
    std::filesystem::path resolve_destination(const std::string& safe_name) const;
};

} // namespace nearshare::storage
