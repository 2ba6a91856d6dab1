#include "nearshare/storage/storage_config.hpp"
#include "nearshare/storage/file_naming.hpp"

namespace nearshare::storage {

StorageConfig::StorageConfig(const std::filesystem::path& download_dir)
    : download_directory(download_dir) {
}

bool StorageConfig::validate() const {
    if (download_directory.empty()) {
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(download_directory, ec) &&
        !std::filesystem::is_directory(download_directory, ec)) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(download_directory);
        return std::filesystem::is_directory(download_directory);
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::optional<std::uint64_t> StorageConfig::get_available_space() const {
    std::error_code ec;
    auto space_info = std::filesystem::space(download_directory, ec);
    if (ec) {
        return std::nullopt;
    }
    return space_info.available;
}

bool StorageConfig::has_sufficient_space(std::uint64_t required_bytes) const {
    auto available = get_available_space();
    return !available || *available >= required_bytes;
}

std::filesystem::path StorageConfig::resolve_destination(const std::string& safe_name) const {
    std::filesystem::path candidate = download_directory / safe_name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    std::filesystem::path name(safe_name);
    std::string stem = name.stem().string();
    std::string extension = name.extension().string();

    if (extension.size() > MAX_FILE_NAME_BYTES / 2) {
        stem = safe_name;
        extension.clear();
    }

    for (unsigned counter = 1;; ++counter) {
        std::string suffix = " (" + std::to_string(counter) + ")" + extension;
        std::string base = stem;
        if (base.size() + suffix.size() > MAX_FILE_NAME_BYTES) {
            std::size_t cut = MAX_FILE_NAME_BYTES - suffix.size();
            while (cut > 0 && (static_cast<unsigned char>(base[cut]) & 0xC0) == 0x80) {
                --cut;
            }
            base.resize(cut);
        }
        candidate = download_directory / (base + suffix);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

} // namespace nearshare::storage
