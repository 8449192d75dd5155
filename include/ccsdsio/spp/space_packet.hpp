#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../core/result.hpp"
#include "../core/types.hpp"
#include "sequence_counter.hpp"
#include "space_packet_header.hpp"

namespace ccsdsio {

// A decoded space packet: primary header plus a copy of its data field
struct SpacePacket {
    SpacePacketHeader header;
    std::vector<uint8_t> payload;

    bool operator==(const SpacePacket&) const = default;
};

/**
 * @brief Encode a complete space packet
 *
 * @param header Header fields (sequence_count and data_length are taken as given)
 * @param payload Packet data field, 1..65536 bytes
 */
inline Result<std::vector<uint8_t>> encode_space_packet(const SpacePacketHeader& header,
                                                        std::span<const uint8_t> payload) {
    auto encoded = encode_space_packet_header(header, payload.size());
    if (!encoded.ok()) {
        return encoded.error();
    }

    std::vector<uint8_t> packet;
    packet.reserve(space_packet_header_bytes + payload.size());
    packet.insert(packet.end(), encoded->begin(), encoded->end());
    packet.insert(packet.end(), payload.begin(), payload.end());
    return packet;
}

/**
 * @brief Encode a space packet stamped with the counter's current value
 *
 * The counter advances only when encoding succeeds, so a rejected packet
 * never consumes a sequence number.
 */
inline Result<std::vector<uint8_t>> encode_space_packet(SpacePacketHeader header,
                                                        std::span<const uint8_t> payload,
                                                        SequenceCounter& counter) {
    header.sequence_count = counter.peek();
    auto packet = encode_space_packet(header, payload);
    if (packet.ok()) {
        counter.next();
    }
    return packet;
}

/**
 * @brief Total length of the packet starting at bytes
 *
 * Reads only the primary header; used to split a byte stream into packets.
 */
inline Result<size_t> space_packet_length(std::span<const uint8_t> bytes) noexcept {
    auto header = decode_space_packet_header(bytes);
    if (!header.ok()) {
        return header.error();
    }
    return header->packet_length();
}

/**
 * @brief Decode one space packet from the front of bytes
 *
 * Bytes past the declared packet length are ignored.
 *
 * @return Packet, or truncated_header / reserved_version / buffer_underflow
 */
inline Result<SpacePacket> decode_space_packet(std::span<const uint8_t> bytes) {
    auto header = decode_space_packet_header(bytes);
    if (!header.ok()) {
        return header.error();
    }
    if (bytes.size() < header->packet_length()) {
        return ValidationError::buffer_underflow;
    }

    auto data = bytes.subspan(space_packet_header_bytes, header->payload_length());
    return SpacePacket{*header, std::vector<uint8_t>(data.begin(), data.end())};
}

} // namespace ccsdsio
