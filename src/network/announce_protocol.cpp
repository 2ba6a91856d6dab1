#include "nearshare/network/announce_protocol.hpp"
#include "nearshare/transfer/frame_codec.hpp"
#include <boost/crc.hpp>
#include <stdexcept>

namespace nearshare::network {

using namespace nearshare::transfer::codec;

AnnounceHeader::AnnounceHeader(AnnounceType msg_type, std::span<const std::uint8_t> payload)
    : magic(ANNOUNCE_MAGIC)
    , version(ANNOUNCE_VERSION)
    , type(msg_type)
    , payload_size(static_cast<std::uint32_t>(payload.size()))
    , checksum(compute_checksum(payload)) {
}

std::vector<std::uint8_t> AnnounceHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(ANNOUNCE_HEADER_SIZE);

    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(0);
    write_uint32(buffer, payload_size);
    write_uint32(buffer, checksum);

    return buffer;
}

AnnounceHeader AnnounceHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < ANNOUNCE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for announce header");
    }

    AnnounceHeader header;
    header.magic = read_uint32(data);
    header.version = read_uint16(data);
    header.type = static_cast<AnnounceType>(data[0]);
    data = data.subspan(2);
    header.payload_size = read_uint32(data);
    header.checksum = read_uint32(data);

    return header;
}

bool AnnounceHeader::is_valid() const {
    return magic == ANNOUNCE_MAGIC &&
           version == ANNOUNCE_VERSION &&
           type >= AnnounceType::ANNOUNCE && type <= AnnounceType::RESPONSE &&
           payload_size <= MAX_DATAGRAM_SIZE - ANNOUNCE_HEADER_SIZE;
}

bool AnnounceHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    return compute_checksum(payload) == checksum;
}

std::uint32_t AnnounceHeader::compute_checksum(std::span<const std::uint8_t> payload) {
    boost::crc_32_type crc;
    crc.process_bytes(payload.data(), payload.size());
    return crc.checksum();
}

std::vector<std::uint8_t> AnnounceMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint64(buffer, node_id);
    write_uint16(buffer, tcp_port);
    write_short_string(buffer, device_name.substr(0, 255));
    return buffer;
}

AnnounceMessage AnnounceMessage::deserialize(std::span<const std::uint8_t> data) {
    AnnounceMessage msg;
    msg.node_id = read_uint64(data);
    msg.tcp_port = read_uint16(data);
    msg.device_name = read_short_string(data);
    return msg;
}

std::vector<std::uint8_t> encode_datagram(AnnounceType type, const std::vector<std::uint8_t>& payload) {
    AnnounceHeader header(type, payload);
    auto message = header.serialize();
    message.insert(message.end(), payload.begin(), payload.end());
    return message;
}

} // namespace nearshare::network
