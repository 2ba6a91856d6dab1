#pragma once

#include "nearshare/storage/transferable_file.hpp"
#include <istream>
#include <memory>
#include <optional>

namespace nearshare::storage {

class ContentResolver {
public:
    virtual ~ContentResolver() = default;

    // Absent when the resource cannot be read.
    virtual std::optional<TransferableFile> resolve(const ResourceHandle& handle) = 0;

    // nullptr when the content cannot be opened.
    virtual std::unique_ptr<std::istream> open(const TransferableFile& file) = 0;
};

class LocalContentResolver : public ContentResolver {
public:
    std::optional<TransferableFile> resolve(const ResourceHandle& handle) override;
    std::unique_ptr<std::istream> open(const TransferableFile& file) override;

    static std::string guess_mime_type(const std::string& file_name);
};

} // namespace nearshare::storage
