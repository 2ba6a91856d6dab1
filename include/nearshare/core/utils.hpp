#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <cstdint>

namespace nearshare::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);

    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_speed(std::uint64_t bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();

    // Replaces a leading "~" with the home directory.
    static std::filesystem::path expand_home(const std::string& path);
};

class SystemUtils {
public:
    static std::string host_name(const std::string& fallback);
};

} // namespace nearshare::core::utils
