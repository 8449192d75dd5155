#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "../core/crc.hpp"
#include "../core/detail/byte_stream.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "../spp/sequence_counter.hpp"
#include "../spp/space_packet_header.hpp"
#include "pus_tc.hpp"

namespace ccsdsio::pus {

// Secondary header bytes preceding the timestamp
inline constexpr size_t tm_secondary_header_bytes_without_time = 7;

// Offset of the service type octet in either a TC or TM packet
inline constexpr size_t service_offset = space_packet_header_bytes + 1;

/**
 * @brief PUS-C telemetry secondary header
 *
 * version(4)=2 | time_ref(4), service(8), subservice(8),
 * message_counter(16), destination_id(16), timestamp
 *
 * The timestamp is opaque here. Its length is mission-defined and must be
 * supplied when decoding.
 */
struct TmSecondaryHeader {
    uint8_t time_reference_status = 0;
    uint8_t service = 0;
    uint8_t subservice = 0;
    uint16_t message_counter = 0;
    uint16_t destination_id = 0;
    std::vector<uint8_t> timestamp;

    bool operator==(const TmSecondaryHeader&) const = default;
};

struct PusTm {
    SpacePacketHeader sp_header;
    TmSecondaryHeader secondary;
    std::vector<uint8_t> source_data;

    bool operator==(const PusTm&) const = default;
};

inline PusTm make_pus_tm(uint16_t apid, uint8_t service, uint8_t subservice,
                         std::span<const uint8_t> timestamp,
                         std::span<const uint8_t> source_data = {}) {
    PusTm tm;
    tm.sp_header.packet_type = SpacePacketType::telemetry;
    tm.sp_header.secondary_header_flag = true;
    tm.sp_header.apid = apid;
    tm.secondary.service = service;
    tm.secondary.subservice = subservice;
    tm.secondary.timestamp.assign(timestamp.begin(), timestamp.end());
    tm.source_data.assign(source_data.begin(), source_data.end());
    return tm;
}

/**
 * @brief Serialize a telemetry packet including its packet error control CRC
 *
 * Packet type and secondary header flag are forced to TM / set.
 */
inline Result<std::vector<uint8_t>> encode_pus_tm(const PusTm& tm) {
    if (tm.secondary.time_reference_status > 0x0F) {
        return ValidationError::value_too_large;
    }
    SpacePacketHeader sp = tm.sp_header;
    sp.packet_type = SpacePacketType::telemetry;
    sp.secondary_header_flag = true;

    size_t payload_length = tm_secondary_header_bytes_without_time +
                            tm.secondary.timestamp.size() + tm.source_data.size() +
                            packet_error_control_bytes;
    auto header = encode_space_packet_header(sp, payload_length);
    if (!header.ok()) {
        return header.error();
    }

    std::vector<uint8_t> out;
    out.reserve(space_packet_header_bytes + payload_length);
    detail::ByteWriter writer(out);
    writer.put_bytes(*header);
    writer.put_u8(static_cast<uint8_t>((pus_c_version << 4) | tm.secondary.time_reference_status));
    writer.put_u8(tm.secondary.service);
    writer.put_u8(tm.secondary.subservice);
    writer.put_u16(tm.secondary.message_counter);
    writer.put_u16(tm.secondary.destination_id);
    writer.put_bytes(tm.secondary.timestamp);
    writer.put_bytes(tm.source_data);
    writer.put_u16(crc16_ccitt_false(out));
    return out;
}

// Stamps the counter's current value; advances it only on success
inline Result<std::vector<uint8_t>> encode_pus_tm(PusTm tm, SequenceCounter& counter) {
    tm.sp_header.sequence_count = counter.peek();
    auto out = encode_pus_tm(tm);
    if (out.ok()) {
        counter.next();
    }
    return out;
}

/**
 * @brief Parse a PUS-C telemetry packet
 *
 * @param bytes Buffer starting with the packet; bytes past the declared
 *              packet length are ignored
 * @param timestamp_length Mission-defined timestamp size in bytes
 * @return Telemetry, or truncated_header / reserved_version /
 *         buffer_underflow / invalid_field_value / crc_mismatch (advisory)
 */
inline Result<PusTm> decode_pus_tm(std::span<const uint8_t> bytes, size_t timestamp_length) {
    auto sp = decode_space_packet_header(bytes);
    if (!sp.ok()) {
        return sp.error();
    }
    if (sp->packet_type != SpacePacketType::telemetry || !sp->secondary_header_flag) {
        return ValidationError::invalid_field_value;
    }
    size_t total = sp->packet_length();
    if (bytes.size() < total || sp->payload_length() < tm_secondary_header_bytes_without_time +
                                                           timestamp_length +
                                                           packet_error_control_bytes) {
        return ValidationError::buffer_underflow;
    }

    auto packet = bytes.first(total);
    detail::ByteReader reader(packet.subspan(space_packet_header_bytes));
    PusTm tm;
    tm.sp_header = *sp;
    uint8_t version_ref = 0;
    std::span<const uint8_t> timestamp;
    std::span<const uint8_t> source_data;
    if (!reader.read_u8(version_ref) || !reader.read_u8(tm.secondary.service) ||
        !reader.read_u8(tm.secondary.subservice) ||
        !reader.read_u16(tm.secondary.message_counter) ||
        !reader.read_u16(tm.secondary.destination_id) ||
        !reader.read_bytes(timestamp_length, timestamp) ||
        !reader.read_bytes(reader.remaining() - packet_error_control_bytes, source_data)) {
        return ValidationError::buffer_underflow;
    }
    if ((version_ref >> 4) != pus_c_version) {
        return ValidationError::invalid_field_value;
    }
    tm.secondary.time_reference_status = static_cast<uint8_t>(version_ref & 0x0F);
    tm.secondary.timestamp.assign(timestamp.begin(), timestamp.end());
    tm.source_data.assign(source_data.begin(), source_data.end());

    if (crc16_ccitt_false(packet) != 0) {
        return Result<PusTm>(std::move(tm), ValidationError::crc_mismatch);
    }
    return tm;
}

/**
 * @brief Service type of a raw PUS packet, for dispatch before full decoding
 *
 * Assumes the caller already knows the bytes carry a PUS packet.
 */
inline Result<uint8_t> pus_service(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() <= service_offset) {
        return ValidationError::buffer_underflow;
    }
    return bytes[service_offset];
}

} // namespace ccsdsio::pus
