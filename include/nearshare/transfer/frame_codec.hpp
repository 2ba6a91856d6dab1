#pragma once

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace nearshare::transfer {

// u16 name_len | name | i64 size | u16 mime_len | mime, all big-endian.
struct FrameHeader {
    std::string name;
    std::int64_t size = 0;
    std::string mime_type;

    std::vector<std::uint8_t> serialize() const;

    // Consumes the header from the front of data. Throws std::runtime_error
    // on truncated or malformed input.
    static FrameHeader deserialize(std::span<const std::uint8_t>& data);

    std::size_t encoded_size() const { return 2 + name.size() + 8 + 2 + mime_type.size(); }
};

constexpr std::size_t MAX_FRAME_STRING_BYTES = 0xFFFF;

namespace codec {

void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value);
void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value);
void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value);
void write_short_string(std::vector<std::uint8_t>& buffer, const std::string& str);

std::uint16_t read_uint16(std::span<const std::uint8_t>& data);
std::uint32_t read_uint32(std::span<const std::uint8_t>& data);
std::uint64_t read_uint64(std::span<const std::uint8_t>& data);
std::string read_short_string(std::span<const std::uint8_t>& data);

} // namespace codec

} // namespace nearshare::transfer
