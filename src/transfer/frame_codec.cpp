#include "nearshare/transfer/frame_codec.hpp"
#include <stdexcept>

namespace nearshare::transfer {

namespace codec {

void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    buffer.push_back((value >> 24) & 0xFF);
    buffer.push_back((value >> 16) & 0xFF);
    buffer.push_back((value >> 8) & 0xFF);
    buffer.push_back(value & 0xFF);
}

void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer.push_back((value >> shift) & 0xFF);
    }
}

void write_short_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
    if (str.size() > MAX_FRAME_STRING_BYTES) {
        throw std::runtime_error("String too long for frame field");
    }
    write_uint16(buffer, static_cast<std::uint16_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
    if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
    std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                         static_cast<std::uint16_t>(data[1]);
    data = data.subspan(2);
    return value;
}

std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
    if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
    std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                         (static_cast<std::uint32_t>(data[1]) << 16) |
                         (static_cast<std::uint32_t>(data[2]) << 8) |
                         static_cast<std::uint32_t>(data[3]);
    data = data.subspan(4);
    return value;
}

std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
    if (data.size() < 8) throw std::runtime_error("Insufficient data for uint64");
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint64_t>(data[i]);
    }
    data = data.subspan(8);
    return value;
}

std::string read_short_string(std::span<const std::uint8_t>& data) {
    auto length = read_uint16(data);
    if (data.size() < length) throw std::runtime_error("Insufficient data for string");
    std::string str(reinterpret_cast<const char*>(data.data()), length);
    data = data.subspan(length);
    return str;
}

} // namespace codec

std::vector<std::uint8_t> FrameHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(encoded_size());

    codec::write_short_string(buffer, name);
    codec::write_uint64(buffer, static_cast<std::uint64_t>(size));
    codec::write_short_string(buffer, mime_type);

    return buffer;
}

FrameHeader FrameHeader::deserialize(std::span<const std::uint8_t>& data) {
    FrameHeader header;
    header.name = codec::read_short_string(data);
    header.size = static_cast<std::int64_t>(codec::read_uint64(data));
    header.mime_type = codec::read_short_string(data);

    if (header.size < 0) {
        throw std::runtime_error("Negative file size in frame header");
    }

    return header;
}

} // namespace nearshare::transfer
