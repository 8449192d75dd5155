#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "../core/bit_field.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"

namespace ccsdsio {

enum class SpacePacketType : uint8_t {
    telemetry = 0,
    telecommand = 1,
};

enum class SequenceFlags : uint8_t {
    continuation = 0b00,  // Continuation segment of user data
    first_segment = 0b01, // First segment of user data
    last_segment = 0b10,  // Last segment of user data
    unsegmented = 0b11,   // Unsegmented user data
};

/**
 * @brief CCSDS space packet primary header (CCSDS 133.0-B-2)
 *
 * Wire layout (6 bytes, big-endian):
 *   version(3) | type(1) | sec_hdr_flag(1) | apid(11)
 *   seq_flags(2) | seq_count(14)
 *   data_length(16) = packet data field bytes - 1
 */
struct SpacePacketHeader {
    uint8_t version = 0;
    SpacePacketType packet_type = SpacePacketType::telemetry;
    bool secondary_header_flag = false;
    uint16_t apid = 0;
    SequenceFlags sequence_flags = SequenceFlags::unsegmented;
    uint16_t sequence_count = 0;
    uint16_t data_length = 0;

    // First 16 bits of the header
    constexpr uint16_t packet_id() const noexcept {
        return static_cast<uint16_t>(((version & 0x07) << 13) |
                                     (static_cast<uint16_t>(packet_type) << 12) |
                                     ((secondary_header_flag ? 1 : 0) << 11) | (apid & max_apid));
    }

    // Second 16 bits of the header
    constexpr uint16_t packet_sequence_control() const noexcept {
        return static_cast<uint16_t>((static_cast<uint16_t>(sequence_flags) << 14) |
                                     (sequence_count & max_sequence_count));
    }

    // Packet data field size implied by data_length
    constexpr size_t payload_length() const noexcept { return size_t{data_length} + 1; }

    // Whole packet size implied by data_length
    constexpr size_t packet_length() const noexcept {
        return space_packet_header_bytes + payload_length();
    }

    bool operator==(const SpacePacketHeader&) const = default;
};

/**
 * @brief Encode a space packet primary header
 *
 * data_length is always recomputed from payload_length; the value held in
 * header.data_length is ignored.
 *
 * @param header Header fields
 * @param payload_length Size of the packet data field (1..65536)
 * @return 6 encoded bytes, or reserved_version / value_too_large /
 *         value_out_of_range
 */
inline Result<std::array<uint8_t, space_packet_header_bytes>>
encode_space_packet_header(const SpacePacketHeader& header, size_t payload_length) noexcept {
    if (header.version != 0) {
        return ValidationError::reserved_version;
    }
    if (payload_length == 0 || payload_length > max_packet_data_bytes) {
        return ValidationError::value_out_of_range;
    }

    std::array<uint8_t, space_packet_header_bytes> bytes{};
    ValidationError err = ValidationError::none;
    auto put = [&](size_t offset, size_t width, uint64_t value) {
        if (err == ValidationError::none) {
            err = write_bits(bytes, offset, width, value);
        }
    };

    put(0, 3, header.version);
    put(3, 1, static_cast<uint8_t>(header.packet_type));
    put(4, 1, header.secondary_header_flag ? 1 : 0);
    put(5, 11, header.apid);
    put(16, 2, static_cast<uint8_t>(header.sequence_flags));
    put(18, 14, header.sequence_count);
    put(32, 16, payload_length - 1);
    if (err != ValidationError::none) {
        return err;
    }
    return bytes;
}

/**
 * @brief Decode a space packet primary header
 *
 * Only the first 6 bytes are examined. Whether the buffer also holds the
 * declared packet data field is the caller's concern (see decode_space_packet).
 *
 * @return Header, or truncated_header / reserved_version
 */
inline Result<SpacePacketHeader> decode_space_packet_header(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() < space_packet_header_bytes) {
        return ValidationError::truncated_header;
    }

    auto field = [&](size_t offset, size_t width) {
        return read_bits(bytes, offset, width).value_or(0);
    };

    SpacePacketHeader header;
    header.version = static_cast<uint8_t>(field(0, 3));
    if (header.version != 0) {
        return ValidationError::reserved_version;
    }
    header.packet_type = static_cast<SpacePacketType>(field(3, 1));
    header.secondary_header_flag = field(4, 1) != 0;
    header.apid = static_cast<uint16_t>(field(5, 11));
    header.sequence_flags = static_cast<SequenceFlags>(field(16, 2));
    header.sequence_count = static_cast<uint16_t>(field(18, 14));
    header.data_length = static_cast<uint16_t>(field(32, 16));
    return header;
}

} // namespace ccsdsio
