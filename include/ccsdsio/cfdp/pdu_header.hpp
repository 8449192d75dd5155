#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../core/bit_field.hpp"
#include "../core/detail/buffer_io.hpp"
#include "../core/detail/byte_stream.hpp"
#include "../core/diagnostics.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "config.hpp"
#include "defs.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief CFDP fixed PDU header
 *
 * Wire layout (big-endian):
 *   byte 0: version(3) | pdu_type(1) | direction(1) | tx_mode(1) | crc_flag(1) | large_file(1)
 *   byte 1-2: PDU data field length (includes the CRC when present)
 *   byte 3: seg_ctrl(1) | entity_id_len-1 (3) | seg_metadata(1) | seq_num_len-1 (3)
 *   source entity id, transaction sequence number, destination entity id
 *
 * Entity ids and the sequence number are held as 64-bit integers regardless
 * of their wire width. Source and destination share one width.
 */
struct PduHeader {
    uint8_t version = protocol_version;
    PduType pdu_type = PduType::file_directive;
    Direction direction = Direction::toward_receiver;
    TransmissionMode transmission_mode = TransmissionMode::acknowledged;
    bool crc_flag = false;
    bool large_file = false;
    uint16_t pdu_data_field_length = 0;
    SegmentationControl segmentation_control = SegmentationControl::boundaries_not_preserved;
    uint8_t entity_id_width = 1;
    bool segment_metadata_flag = false;
    uint8_t sequence_number_width = 1;
    uint64_t source_entity_id = 0;
    uint64_t transaction_sequence_number = 0;
    uint64_t destination_entity_id = 0;

    // Header bytes up to the end of the destination entity id
    constexpr size_t header_length() const noexcept {
        return fixed_header_bytes + 2 * size_t{entity_id_width} + sequence_number_width;
    }

    // Header plus the directive code octet of a file directive PDU
    constexpr size_t directive_header_length() const noexcept { return header_length() + 1; }

    constexpr size_t pdu_length() const noexcept {
        return header_length() + pdu_data_field_length;
    }

    constexpr size_t file_size_bytes() const noexcept { return file_size_field_bytes(large_file); }

    bool operator==(const PduHeader&) const = default;
};

// Raw 3-bit length field for a byte width of 1, 2, 4 or 8
constexpr Result<uint8_t> encode_width_field(size_t width) noexcept {
    if (!is_valid_field_width(width)) {
        return ValidationError::invalid_length_field;
    }
    return static_cast<uint8_t>(width - 1);
}

// Byte width for a raw 3-bit length field; only 0, 1, 3 and 7 are legal
constexpr Result<uint8_t> decode_width_field(uint8_t raw) noexcept {
    if (!is_valid_field_width(size_t{raw} + 1)) {
        return ValidationError::invalid_length_field;
    }
    return static_cast<uint8_t>(raw + 1);
}

/**
 * @brief Append an encoded PDU header to out
 *
 * pdu_data_field_length is written as given; PduCodec fills it in.
 *
 * Sub-byte fields that do not fit their bit width fail with value_too_large.
 *
 * @return none, reserved_version, invalid_length_field or value_too_large.
 *         out is unchanged on error.
 */
inline ValidationError encode_pdu_header(const PduHeader& h, std::vector<uint8_t>& out) {
    if (h.version != protocol_version) {
        return ValidationError::reserved_version;
    }
    auto eid_raw = encode_width_field(h.entity_id_width);
    auto seq_raw = encode_width_field(h.sequence_number_width);
    if (!eid_raw.ok() || !seq_raw.ok()) {
        return ValidationError::invalid_length_field;
    }
    if (!ccsdsio::detail::fits_in_bytes(h.source_entity_id, h.entity_id_width) ||
        !ccsdsio::detail::fits_in_bytes(h.destination_entity_id, h.entity_id_width) ||
        !ccsdsio::detail::fits_in_bytes(h.transaction_sequence_number, h.sequence_number_width)) {
        return ValidationError::value_too_large;
    }

    std::array<uint8_t, fixed_header_bytes> fixed{};
    ValidationError err = ValidationError::none;
    auto put = [&](size_t offset, size_t width, uint64_t value) {
        if (err == ValidationError::none) {
            err = write_bits(fixed, offset, width, value);
        }
    };

    put(0, 3, h.version);
    put(3, 1, static_cast<uint8_t>(h.pdu_type));
    put(4, 1, static_cast<uint8_t>(h.direction));
    put(5, 1, static_cast<uint8_t>(h.transmission_mode));
    put(6, 1, h.crc_flag ? 1 : 0);
    put(7, 1, h.large_file ? 1 : 0);
    put(8, 16, h.pdu_data_field_length);
    put(24, 1, static_cast<uint8_t>(h.segmentation_control));
    put(25, 3, *eid_raw);
    put(28, 1, h.segment_metadata_flag ? 1 : 0);
    put(29, 3, *seq_raw);
    if (err != ValidationError::none) {
        return err;
    }

    ccsdsio::detail::ByteWriter writer(out);
    writer.put_bytes(fixed);
    writer.put_uint(h.entity_id_width, h.source_entity_id);
    writer.put_uint(h.sequence_number_width, h.transaction_sequence_number);
    writer.put_uint(h.entity_id_width, h.destination_entity_id);
    return ValidationError::none;
}

inline Result<std::vector<uint8_t>> encode_pdu_header(const PduHeader& h) {
    std::vector<uint8_t> out;
    out.reserve(h.header_length());
    if (auto err = encode_pdu_header(h, out); err != ValidationError::none) {
        return err;
    }
    return out;
}

/**
 * @brief Decode a PDU header without checking the data field length
 *
 * Used by stream readers to find where the PDU ends. Only header bytes are
 * examined. A version other than 001 accepted under the warn policy is
 * decoded as 001, so the header re-encodes.
 *
 * @return Header, or truncated_header / reserved_version / invalid_length_field
 */
inline Result<PduHeader> peek_pdu_header(std::span<const uint8_t> bytes,
                                         const CfdpConfig& config = {}) noexcept {
    if (bytes.size() < fixed_header_bytes) {
        return ValidationError::truncated_header;
    }

    auto field = [&](size_t offset, size_t width) {
        return read_bits(bytes, offset, width).value_or(0);
    };

    PduHeader h;
    if (field(0, 3) != protocol_version) {
        if (config.reserved_fields == ReservedFieldPolicy::reject) {
            return ValidationError::reserved_version;
        }
        ccsdsio::detail::report(config.sink, Severity::warning, ValidationError::reserved_version,
                                "CFDP PDU header version is not 001");
    }
    h.pdu_type = static_cast<PduType>(field(3, 1));
    h.direction = static_cast<Direction>(field(4, 1));
    h.transmission_mode = static_cast<TransmissionMode>(field(5, 1));
    h.crc_flag = field(6, 1) != 0;
    h.large_file = field(7, 1) != 0;
    h.pdu_data_field_length = static_cast<uint16_t>(field(8, 16));
    h.segmentation_control = static_cast<SegmentationControl>(field(24, 1));
    h.segment_metadata_flag = field(28, 1) != 0;
    auto eid_width = decode_width_field(static_cast<uint8_t>(field(25, 3)));
    auto seq_width = decode_width_field(static_cast<uint8_t>(field(29, 3)));
    if (!eid_width.ok() || !seq_width.ok()) {
        return ValidationError::invalid_length_field;
    }
    h.entity_id_width = *eid_width;
    h.sequence_number_width = *seq_width;

    if (bytes.size() < h.header_length()) {
        return ValidationError::truncated_header;
    }
    size_t offset = fixed_header_bytes;
    h.source_entity_id = ccsdsio::detail::read_uint(bytes.data(), offset, h.entity_id_width);
    offset += h.entity_id_width;
    h.transaction_sequence_number =
        ccsdsio::detail::read_uint(bytes.data(), offset, h.sequence_number_width);
    offset += h.sequence_number_width;
    h.destination_entity_id = ccsdsio::detail::read_uint(bytes.data(), offset, h.entity_id_width);
    return h;
}

/**
 * @brief Decode the header of a PDU occupying exactly bytes
 *
 * The declared data field length must equal the bytes following the header.
 *
 * @return Header, or truncated_header / reserved_version /
 *         invalid_length_field / header_length_mismatch
 */
inline Result<PduHeader> decode_pdu_header(std::span<const uint8_t> bytes,
                                           const CfdpConfig& config = {}) noexcept {
    auto h = peek_pdu_header(bytes, config);
    if (!h.ok()) {
        return h;
    }
    if (bytes.size() - h->header_length() != h->pdu_data_field_length) {
        return ValidationError::header_length_mismatch;
    }
    return h;
}

// Total PDU length declared by the header at the front of bytes
inline Result<size_t> peek_pdu_length(std::span<const uint8_t> bytes) noexcept {
    auto h = peek_pdu_header(bytes);
    if (!h.ok()) {
        return h.error();
    }
    return h->pdu_length();
}

} // namespace ccsdsio::cfdp
