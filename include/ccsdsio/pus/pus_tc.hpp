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

namespace ccsdsio::pus {

// Version number carried in PUS-C secondary headers
inline constexpr uint8_t pus_c_version = 2;

inline constexpr size_t tc_secondary_header_bytes = 5;
inline constexpr size_t packet_error_control_bytes = 2;

// Acknowledgement request flags, bits 3-0 of the first secondary header octet
inline constexpr uint8_t ack_acceptance = 0b0001;
inline constexpr uint8_t ack_start = 0b0010;
inline constexpr uint8_t ack_progress = 0b0100;
inline constexpr uint8_t ack_completion = 0b1000;
inline constexpr uint8_t ack_all = 0b1111;

/**
 * @brief PUS-C telecommand secondary header
 *
 * version(4)=2 | ack(4), service(8), subservice(8), source_id(16)
 */
struct TcSecondaryHeader {
    uint8_t ack_flags = ack_all;
    uint8_t service = 0;
    uint8_t subservice = 0;
    uint16_t source_id = 0;

    bool operator==(const TcSecondaryHeader&) const = default;
};

struct PusTc {
    SpacePacketHeader sp_header;
    TcSecondaryHeader secondary;
    std::vector<uint8_t> app_data;

    bool operator==(const PusTc&) const = default;
};

// Telecommand header for an unsegmented packet on apid
inline PusTc make_pus_tc(uint16_t apid, uint8_t service, uint8_t subservice,
                         std::span<const uint8_t> app_data = {}) {
    PusTc tc;
    tc.sp_header.packet_type = SpacePacketType::telecommand;
    tc.sp_header.secondary_header_flag = true;
    tc.sp_header.apid = apid;
    tc.secondary.service = service;
    tc.secondary.subservice = subservice;
    tc.app_data.assign(app_data.begin(), app_data.end());
    return tc;
}

/**
 * @brief Serialize a telecommand including its packet error control CRC
 *
 * Packet type and secondary header flag are forced to TC / set. The CRC-16
 * covers every byte from the primary header to the end of app_data.
 */
inline Result<std::vector<uint8_t>> encode_pus_tc(const PusTc& tc) {
    if (tc.secondary.ack_flags > 0x0F) {
        return ValidationError::value_too_large;
    }
    SpacePacketHeader sp = tc.sp_header;
    sp.packet_type = SpacePacketType::telecommand;
    sp.secondary_header_flag = true;

    size_t payload_length =
        tc_secondary_header_bytes + tc.app_data.size() + packet_error_control_bytes;
    auto header = encode_space_packet_header(sp, payload_length);
    if (!header.ok()) {
        return header.error();
    }

    std::vector<uint8_t> out;
    out.reserve(space_packet_header_bytes + payload_length);
    detail::ByteWriter writer(out);
    writer.put_bytes(*header);
    writer.put_u8(static_cast<uint8_t>((pus_c_version << 4) | tc.secondary.ack_flags));
    writer.put_u8(tc.secondary.service);
    writer.put_u8(tc.secondary.subservice);
    writer.put_u16(tc.secondary.source_id);
    writer.put_bytes(tc.app_data);
    writer.put_u16(crc16_ccitt_false(out));
    return out;
}

// Stamps the counter's current value; advances it only on success
inline Result<std::vector<uint8_t>> encode_pus_tc(PusTc tc, SequenceCounter& counter) {
    tc.sp_header.sequence_count = counter.peek();
    auto out = encode_pus_tc(tc);
    if (out.ok()) {
        counter.next();
    }
    return out;
}

/**
 * @brief Parse a PUS-C telecommand
 *
 * A CRC mismatch is advisory: the parsed telecommand is still returned.
 *
 * @return Telecommand, or truncated_header / reserved_version /
 *         buffer_underflow / invalid_field_value / crc_mismatch
 */
inline Result<PusTc> decode_pus_tc(std::span<const uint8_t> bytes) {
    auto sp = decode_space_packet_header(bytes);
    if (!sp.ok()) {
        return sp.error();
    }
    if (sp->packet_type != SpacePacketType::telecommand || !sp->secondary_header_flag) {
        return ValidationError::invalid_field_value;
    }
    size_t total = sp->packet_length();
    if (bytes.size() < total ||
        sp->payload_length() < tc_secondary_header_bytes + packet_error_control_bytes) {
        return ValidationError::buffer_underflow;
    }

    auto packet = bytes.first(total);
    detail::ByteReader reader(packet.subspan(space_packet_header_bytes));
    PusTc tc;
    tc.sp_header = *sp;
    uint8_t version_ack = 0;
    std::span<const uint8_t> app_data;
    if (!reader.read_u8(version_ack) || !reader.read_u8(tc.secondary.service) ||
        !reader.read_u8(tc.secondary.subservice) || !reader.read_u16(tc.secondary.source_id) ||
        !reader.read_bytes(reader.remaining() - packet_error_control_bytes, app_data)) {
        return ValidationError::buffer_underflow;
    }
    if ((version_ack >> 4) != pus_c_version) {
        return ValidationError::invalid_field_value;
    }
    tc.secondary.ack_flags = static_cast<uint8_t>(version_ack & 0x0F);
    tc.app_data.assign(app_data.begin(), app_data.end());

    if (crc16_ccitt_false(packet) != 0) {
        return Result<PusTc>(std::move(tc), ValidationError::crc_mismatch);
    }
    return tc;
}

} // namespace ccsdsio::pus
