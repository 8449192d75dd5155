#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../core/bit_field.hpp"
#include "../core/detail/buffer_io.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"

namespace ccsdsio::uslp {

inline constexpr uint8_t transfer_frame_version = 0b1100;
inline constexpr size_t primary_header_fixed_bytes = 7;
inline constexpr size_t truncated_primary_header_bytes = 4;
inline constexpr size_t max_vcf_count_length = 7;

/**
 * @brief USLP transfer frame primary header (CCSDS 732.1-B-2)
 *
 * Octets 0-3: TFVN(4) | SCID(16) | src/dest(1) | VCID(6) | MAP ID(4) | EOFPH(1)
 * Octets 4-6: frame length(16) | bypass(1) | protocol ctrl cmd(1) | spare(2) |
 *             OCF flag(1) | VCF count length(3)
 * Then 0..7 octets of virtual channel frame count.
 *
 * With the end-of-frame-primary-header flag set, the header is truncated to
 * the first 4 octets and the remaining fields are not transmitted.
 */
struct PrimaryHeader {
    uint8_t tfvn = transfer_frame_version;
    uint16_t scid = 0;
    bool destination = false; // false: SCID is the source, true: the destination
    uint8_t vcid = 0;
    uint8_t map_id = 0;
    bool truncated = false; // End-of-frame-primary-header flag
    uint16_t frame_length = 0; // Total frame octets - 1
    bool bypass = false;
    bool protocol_control_command = false;
    bool ocf_present = false;
    uint8_t vcf_count_length = 0;
    uint64_t vcf_count = 0;

    size_t encoded_length() const noexcept {
        return truncated ? truncated_primary_header_bytes
                         : primary_header_fixed_bytes + vcf_count_length;
    }

    bool operator==(const PrimaryHeader&) const = default;
};

namespace detail {

inline ValidationError check_primary_header(const PrimaryHeader& h) noexcept {
    if (h.tfvn != transfer_frame_version) {
        return ValidationError::reserved_version;
    }
    if (h.vcid > 0x3F || h.map_id > 0x0F) {
        return ValidationError::value_too_large;
    }
    if (h.truncated) {
        return ValidationError::none;
    }
    if (h.vcf_count_length > max_vcf_count_length) {
        return ValidationError::value_too_large;
    }
    if (h.vcf_count_length == 0 && h.vcf_count != 0) {
        return ValidationError::invalid_field_value;
    }
    if (!ccsdsio::detail::fits_in_bytes(h.vcf_count, h.vcf_count_length)) {
        return ValidationError::value_too_large;
    }
    return ValidationError::none;
}

} // namespace detail

inline Result<std::vector<uint8_t>> encode_primary_header(const PrimaryHeader& h) {
    if (auto err = detail::check_primary_header(h); err != ValidationError::none) {
        return err;
    }

    std::vector<uint8_t> out(h.encoded_length(), 0);
    std::span<uint8_t> bytes(out);
    ValidationError err = ValidationError::none;
    auto put = [&](size_t offset, size_t width, uint64_t value) {
        if (err == ValidationError::none) {
            err = write_bits(bytes, offset, width, value);
        }
    };

    put(0, 4, h.tfvn);
    put(4, 16, h.scid);
    put(20, 1, h.destination ? 1 : 0);
    put(21, 6, h.vcid);
    put(27, 4, h.map_id);
    put(31, 1, h.truncated ? 1 : 0);
    if (!h.truncated) {
        put(32, 16, h.frame_length);
        put(48, 1, h.bypass ? 1 : 0);
        put(49, 1, h.protocol_control_command ? 1 : 0);
        put(52, 1, h.ocf_present ? 1 : 0);
        put(53, 3, h.vcf_count_length);
    }
    if (err != ValidationError::none) {
        return err;
    }
    if (!h.truncated && h.vcf_count_length > 0) {
        ccsdsio::detail::write_uint(out.data(), primary_header_fixed_bytes, h.vcf_count_length,
                                    h.vcf_count);
    }
    return out;
}

/**
 * @brief Decode a USLP primary header from the front of bytes
 * @return Header, or truncated_header / reserved_version
 */
inline Result<PrimaryHeader> decode_primary_header(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() < truncated_primary_header_bytes) {
        return ValidationError::truncated_header;
    }

    auto field = [&](size_t offset, size_t width) {
        return read_bits(bytes, offset, width).value_or(0);
    };

    PrimaryHeader h;
    h.tfvn = static_cast<uint8_t>(field(0, 4));
    if (h.tfvn != transfer_frame_version) {
        return ValidationError::reserved_version;
    }
    h.scid = static_cast<uint16_t>(field(4, 16));
    h.destination = field(20, 1) != 0;
    h.vcid = static_cast<uint8_t>(field(21, 6));
    h.map_id = static_cast<uint8_t>(field(27, 4));
    h.truncated = field(31, 1) != 0;
    if (h.truncated) {
        return h;
    }

    if (bytes.size() < primary_header_fixed_bytes) {
        return ValidationError::truncated_header;
    }
    h.frame_length = static_cast<uint16_t>(field(32, 16));
    h.bypass = field(48, 1) != 0;
    h.protocol_control_command = field(49, 1) != 0;
    h.ocf_present = field(52, 1) != 0;
    h.vcf_count_length = static_cast<uint8_t>(field(53, 3));
    if (bytes.size() < primary_header_fixed_bytes + h.vcf_count_length) {
        return ValidationError::truncated_header;
    }
    if (h.vcf_count_length > 0) {
        h.vcf_count = ccsdsio::detail::read_uint(bytes.data(), primary_header_fixed_bytes,
                                                 h.vcf_count_length);
    }
    return h;
}

} // namespace ccsdsio::uslp
