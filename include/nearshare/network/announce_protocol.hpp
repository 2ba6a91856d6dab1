#pragma once

#include <span>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace nearshare::network {

constexpr std::uint32_t ANNOUNCE_MAGIC = 0x4E534852; // "NSHR"
constexpr std::uint16_t ANNOUNCE_VERSION = 1;
constexpr std::size_t ANNOUNCE_HEADER_SIZE = 16;
constexpr std::size_t MAX_DATAGRAM_SIZE = 1024;

enum class AnnounceType : std::uint8_t {
    ANNOUNCE = 0x01,
    QUERY    = 0x02,
    RESPONSE = 0x03
};

struct AnnounceHeader {
    std::uint32_t magic = ANNOUNCE_MAGIC;
    std::uint16_t version = ANNOUNCE_VERSION;
    AnnounceType type = AnnounceType::ANNOUNCE;
    std::uint32_t payload_size = 0;
    std::uint32_t checksum = 0;    // CRC-32 of payload

    AnnounceHeader() = default;
    AnnounceHeader(AnnounceType msg_type, std::span<const std::uint8_t> payload);

    std::vector<std::uint8_t> serialize() const;
    static AnnounceHeader deserialize(std::span<const std::uint8_t> data);

    bool is_valid() const;
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    static std::uint32_t compute_checksum(std::span<const std::uint8_t> payload);
};

struct AnnounceMessage {
    std::uint64_t node_id = 0;
    std::uint16_t tcp_port = 0;
    std::string device_name;

    std::vector<std::uint8_t> serialize() const;
    static AnnounceMessage deserialize(std::span<const std::uint8_t> data);
};

// Header followed by payload, ready to send as one datagram.
std::vector<std::uint8_t> encode_datagram(AnnounceType type, const std::vector<std::uint8_t>& payload);

} // namespace nearshare::network
