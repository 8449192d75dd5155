#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../core/detail/buffer_io.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "epoch.hpp"
#include "p_field.hpp"

namespace ccsdsio {

/**
 * @brief CCSDS Unsegmented Time Code layout
 *
 * Single-octet P-field: ext(1)=0 | id(3) | coarse_bytes-1 (2) | fine_bytes (2).
 * The T-field holds coarse_bytes of whole seconds followed by fine_bytes of
 * binary fraction of a second.
 */
struct CucFormat {
    uint8_t coarse_bytes = 4; // 1..4
    uint8_t fine_bytes = 2;   // 0..3
    bool agency_epoch = false;

    constexpr ValidationError validate() const noexcept {
        if (coarse_bytes < 1 || coarse_bytes > 4 || fine_bytes > 3) {
            return ValidationError::invalid_configuration;
        }
        return ValidationError::none;
    }

    constexpr TimeCodeId time_code_id() const noexcept {
        return agency_epoch ? TimeCodeId::cuc_level2 : TimeCodeId::cuc_level1;
    }

    constexpr uint8_t p_field() const noexcept {
        return static_cast<uint8_t>((static_cast<uint8_t>(time_code_id()) << 4) |
                                    (((coarse_bytes - 1) & 0x03) << 2) | (fine_bytes & 0x03));
    }

    constexpr size_t t_field_length() const noexcept { return size_t{coarse_bytes} + fine_bytes; }

    // P-field plus T-field
    constexpr size_t encoded_length() const noexcept { return 1 + t_field_length(); }

    constexpr uint64_t max_coarse() const noexcept {
        return (uint64_t{1} << (8 * coarse_bytes)) - 1;
    }

    constexpr uint32_t fine_modulus() const noexcept {
        return static_cast<uint32_t>(uint64_t{1} << (8 * fine_bytes));
    }

    bool operator==(const CucFormat&) const = default;
};

/**
 * @brief Parse a CUC P-field
 * @return Format, or invalid_p_field for an extension bit or a non-CUC id
 */
constexpr Result<CucFormat> decode_cuc_p_field(uint8_t p_field) noexcept {
    if (p_field_extended(p_field)) {
        return ValidationError::invalid_p_field;
    }
    auto id = p_field_time_code_id(p_field);
    if (id != TimeCodeId::cuc_level1 && id != TimeCodeId::cuc_level2) {
        return ValidationError::invalid_p_field;
    }
    CucFormat format;
    format.agency_epoch = (id == TimeCodeId::cuc_level2);
    format.coarse_bytes = static_cast<uint8_t>(((p_field >> 2) & 0x03) + 1);
    format.fine_bytes = static_cast<uint8_t>(p_field & 0x03);
    return format;
}

/**
 * @brief A CUC time value: whole seconds plus a binary fraction
 */
struct CucTimeCode {
    CucFormat format;
    uint64_t coarse = 0; // Seconds since epoch
    uint32_t fine = 0;   // Fraction of a second, units of 2^-(8 * fine_bytes) s

    // Fractional part truncated to nanoseconds
    std::chrono::nanoseconds subsecond() const noexcept {
        if (format.fine_bytes == 0) {
            return std::chrono::nanoseconds(0);
        }
        uint64_t ns = (uint64_t{fine} * detail::nanoseconds_per_second) >> (8 * format.fine_bytes);
        return std::chrono::nanoseconds(static_cast<int64_t>(ns));
    }

    std::chrono::system_clock::time_point to_time_point(const Epoch& epoch) const noexcept {
        return detail::time_point_at(epoch, std::chrono::seconds(coarse) + subsecond());
    }

    bool operator==(const CucTimeCode&) const = default;
};

/**
 * @brief Build a CUC value for a time point
 *
 * The fraction is truncated to the resolution of the fine field.
 *
 * @return Value, or invalid_configuration / value_out_of_range when tp
 *         precedes the epoch or the seconds overflow the coarse field
 */
inline Result<CucTimeCode> make_cuc(std::chrono::system_clock::time_point tp,
                                    const CucFormat& format, const Epoch& epoch) noexcept {
    if (auto err = format.validate(); err != ValidationError::none) {
        return err;
    }
    int64_t elapsed = detail::nanoseconds_since(epoch, tp);
    if (elapsed < 0) {
        return ValidationError::value_out_of_range;
    }
    auto ns = static_cast<uint64_t>(elapsed);
    uint64_t seconds = ns / detail::nanoseconds_per_second;
    uint64_t remainder = ns % detail::nanoseconds_per_second;
    if (seconds > format.max_coarse()) {
        return ValidationError::value_out_of_range;
    }

    CucTimeCode code;
    code.format = format;
    code.coarse = seconds;
    code.fine = static_cast<uint32_t>((remainder << (8 * format.fine_bytes)) /
                                      detail::nanoseconds_per_second);
    return code;
}

namespace detail {

inline ValidationError check_cuc(const CucTimeCode& code) noexcept {
    if (auto err = code.format.validate(); err != ValidationError::none) {
        return err;
    }
    if (code.coarse > code.format.max_coarse() || code.fine >= code.format.fine_modulus()) {
        return ValidationError::value_out_of_range;
    }
    return ValidationError::none;
}

inline void put_cuc_t_field(std::vector<uint8_t>& out, const CucTimeCode& code) {
    size_t offset = out.size();
    out.resize(offset + code.format.t_field_length());
    write_uint(out.data(), offset, code.format.coarse_bytes, code.coarse);
    if (code.format.fine_bytes > 0) {
        write_uint(out.data(), offset + code.format.coarse_bytes, code.format.fine_bytes,
                   code.fine);
    }
}

} // namespace detail

// P-field followed by T-field
inline Result<std::vector<uint8_t>> encode_cuc(const CucTimeCode& code) {
    if (auto err = detail::check_cuc(code); err != ValidationError::none) {
        return err;
    }
    std::vector<uint8_t> out;
    out.reserve(code.format.encoded_length());
    out.push_back(code.format.p_field());
    detail::put_cuc_t_field(out, code);
    return out;
}

// T-field only, for formats agreed out of band
inline Result<std::vector<uint8_t>> encode_cuc_t_field(const CucTimeCode& code) {
    if (auto err = detail::check_cuc(code); err != ValidationError::none) {
        return err;
    }
    std::vector<uint8_t> out;
    out.reserve(code.format.t_field_length());
    detail::put_cuc_t_field(out, code);
    return out;
}

/**
 * @brief Decode a T-field whose format is known in advance
 * @return Value, or invalid_configuration / buffer_underflow
 */
inline Result<CucTimeCode> decode_cuc_t_field(std::span<const uint8_t> bytes,
                                              const CucFormat& format) noexcept {
    if (auto err = format.validate(); err != ValidationError::none) {
        return err;
    }
    if (bytes.size() < format.t_field_length()) {
        return ValidationError::buffer_underflow;
    }
    CucTimeCode code;
    code.format = format;
    code.coarse = detail::read_uint(bytes.data(), 0, format.coarse_bytes);
    if (format.fine_bytes > 0) {
        code.fine = static_cast<uint32_t>(
            detail::read_uint(bytes.data(), format.coarse_bytes, format.fine_bytes));
    }
    return code;
}

/**
 * @brief Decode a P-field and the T-field it describes
 * @return Value, or invalid_p_field / buffer_underflow
 */
inline Result<CucTimeCode> decode_cuc(std::span<const uint8_t> bytes) noexcept {
    if (bytes.empty()) {
        return ValidationError::buffer_underflow;
    }
    auto format = decode_cuc_p_field(bytes[0]);
    if (!format.ok()) {
        return format.error();
    }
    return decode_cuc_t_field(bytes.subspan(1), *format);
}

} // namespace ccsdsio
