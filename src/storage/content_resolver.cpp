#include "nearshare/storage/content_resolver.hpp"
#include "nearshare/core/logger.hpp"
#include "nearshare/core/utils.hpp"
#include <filesystem>
#include <fstream>
#include <unordered_map>

namespace nearshare::storage {

std::optional<TransferableFile> LocalContentResolver::resolve(const ResourceHandle& handle) {
    std::filesystem::path path = core::utils::FileUtils::expand_home(handle);

    if (!core::utils::FileUtils::is_file(path)) {
        LOG_WARN("Cannot resolve '{}': not a regular file", handle);
        return std::nullopt;
    }

    auto size = core::utils::FileUtils::file_size(path);
    if (!size) {
        LOG_WARN("Cannot resolve '{}': size unavailable", handle);
        return std::nullopt;
    }

    TransferableFile file;
    file.handle = path.string();
    file.name = path.filename().string();
    file.size_bytes = static_cast<std::int64_t>(*size);
    auto mime = guess_mime_type(file.name);
    if (!mime.empty()) {
        file.mime_type = mime;
    }
    return file;
}

std::unique_ptr<std::istream> LocalContentResolver::open(const TransferableFile& file) {
    auto stream = std::make_unique<std::ifstream>(file.handle, std::ios::binary);
    if (!stream->is_open()) {
        LOG_ERROR("Failed to open '{}' for reading", file.handle);
        return nullptr;
    }
    return stream;
}

std::string LocalContentResolver::guess_mime_type(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> mime_types = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".apk", "application/vnd.android.package-archive"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"}
    };

    auto extension = core::utils::StringUtils::to_lower(
        std::filesystem::path(file_name).extension().string());
    auto it = mime_types.find(extension);
    return it != mime_types.end() ? it->second : std::string();
}

} // namespace nearshare::storage
