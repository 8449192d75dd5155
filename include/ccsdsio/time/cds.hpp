#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../core/detail/byte_stream.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "epoch.hpp"
#include "p_field.hpp"

namespace ccsdsio {

// Resolution of the optional CDS sub-millisecond segment
enum class CdsResolution : uint8_t {
    milliseconds = 0b00, // No sub-millisecond segment
    microseconds = 0b01, // 16-bit microsecond of millisecond
    picoseconds = 0b10,  // 32-bit picosecond of millisecond
};

inline constexpr uint32_t cds_max_ms_of_day = 86'401'000; // exclusive, allows one leap second
inline constexpr uint32_t cds_microseconds_per_ms = 1'000;
inline constexpr uint32_t cds_picoseconds_per_ms = 1'000'000'000;

/**
 * @brief CCSDS Day Segmented Time Code layout
 *
 * P-field: ext(1)=0 | id(3)=100 | epoch(1) | day_length(1) | resolution(2).
 * T-field: day (16 or 24 bits), millisecond of day (32 bits), then an optional
 * 16-bit microsecond or 32-bit picosecond segment.
 */
struct CdsFormat {
    bool agency_epoch = false;
    bool day_24bit = false;
    CdsResolution resolution = CdsResolution::milliseconds;

    constexpr ValidationError validate() const noexcept {
        if (static_cast<uint8_t>(resolution) > 0b10) {
            return ValidationError::invalid_configuration;
        }
        return ValidationError::none;
    }

    constexpr uint8_t p_field() const noexcept {
        return static_cast<uint8_t>((static_cast<uint8_t>(TimeCodeId::cds) << 4) |
                                    ((agency_epoch ? 1 : 0) << 3) | ((day_24bit ? 1 : 0) << 2) |
                                    (static_cast<uint8_t>(resolution) & 0x03));
    }

    constexpr size_t day_bytes() const noexcept { return day_24bit ? 3 : 2; }

    constexpr size_t submillisecond_bytes() const noexcept {
        switch (resolution) {
            case CdsResolution::microseconds:
                return 2;
            case CdsResolution::picoseconds:
                return 4;
            default:
                return 0;
        }
    }

    constexpr size_t t_field_length() const noexcept {
        return day_bytes() + 4 + submillisecond_bytes();
    }

    constexpr size_t encoded_length() const noexcept { return 1 + t_field_length(); }

    constexpr uint32_t max_day() const noexcept { return day_24bit ? 0xFFFFFF : 0xFFFF; }

    bool operator==(const CdsFormat&) const = default;
};

// The 7-byte CDS short timestamp (P-field 0x40) used by PUS telemetry
inline constexpr CdsFormat cds_short_format{};

/**
 * @brief Parse a CDS P-field
 * @return Format, or invalid_p_field for an extension bit, a non-CDS id or the
 *         reserved resolution code 11
 */
constexpr Result<CdsFormat> decode_cds_p_field(uint8_t p_field) noexcept {
    if (p_field_extended(p_field) || p_field_time_code_id(p_field) != TimeCodeId::cds) {
        return ValidationError::invalid_p_field;
    }
    if ((p_field & 0x03) == 0x03) {
        return ValidationError::invalid_p_field;
    }
    CdsFormat format;
    format.agency_epoch = (p_field & 0x08) != 0;
    format.day_24bit = (p_field & 0x04) != 0;
    format.resolution = static_cast<CdsResolution>(p_field & 0x03);
    return format;
}

struct CdsTimeCode {
    CdsFormat format;
    uint32_t day = 0;
    uint32_t ms_of_day = 0;
    uint32_t submillisecond = 0; // Microseconds or picoseconds of the millisecond

    /**
     * @brief Time elapsed since the epoch
     *
     * A 24-bit day segment reaches further than std::chrono::nanoseconds.
     *
     * @return Duration, or value_out_of_range when it does not fit
     */
    Result<std::chrono::nanoseconds> since_epoch() const noexcept {
        constexpr int64_t ns_per_day = 86'400'000'000'000LL;
        int64_t within_day = static_cast<int64_t>(ms_of_day) * 1'000'000LL;
        if (format.resolution == CdsResolution::microseconds) {
            within_day += static_cast<int64_t>(submillisecond) * 1'000;
        } else if (format.resolution == CdsResolution::picoseconds) {
            within_day += static_cast<int64_t>(submillisecond / 1'000);
        }
        constexpr int64_t limit = std::chrono::nanoseconds::max().count();
        if (static_cast<int64_t>(day) > (limit - within_day) / ns_per_day) {
            return ValidationError::value_out_of_range;
        }
        return std::chrono::nanoseconds(static_cast<int64_t>(day) * ns_per_day + within_day);
    }

    // value_out_of_range when the instant is outside the range of system_clock
    Result<std::chrono::system_clock::time_point> to_time_point(const Epoch& epoch) const noexcept {
        auto elapsed = since_epoch();
        if (!elapsed.ok()) {
            return elapsed.error();
        }
        return detail::checked_time_point_at(epoch, *elapsed);
    }

    bool operator==(const CdsTimeCode&) const = default;
};

/**
 * @brief Build a CDS value for a time point
 * @return Value, or value_out_of_range when tp precedes the epoch or the day
 *         count overflows the day segment
 */
inline Result<CdsTimeCode> make_cds(std::chrono::system_clock::time_point tp,
                                    const CdsFormat& format, const Epoch& epoch) noexcept {
    if (auto err = format.validate(); err != ValidationError::none) {
        return err;
    }
    int64_t elapsed = detail::nanoseconds_since(epoch, tp);
    if (elapsed < 0) {
        return ValidationError::value_out_of_range;
    }
    auto ns = static_cast<uint64_t>(elapsed);
    constexpr uint64_t ns_per_day = detail::seconds_per_day * detail::nanoseconds_per_second;
    uint64_t day = ns / ns_per_day;
    if (day > format.max_day()) {
        return ValidationError::value_out_of_range;
    }
    uint64_t ns_of_day = ns % ns_per_day;

    CdsTimeCode code;
    code.format = format;
    code.day = static_cast<uint32_t>(day);
    code.ms_of_day = static_cast<uint32_t>(ns_of_day / 1'000'000);
    uint64_t ns_of_ms = ns_of_day % 1'000'000;
    if (format.resolution == CdsResolution::microseconds) {
        code.submillisecond = static_cast<uint32_t>(ns_of_ms / 1'000);
    } else if (format.resolution == CdsResolution::picoseconds) {
        code.submillisecond = static_cast<uint32_t>(ns_of_ms * 1'000);
    }
    return code;
}

namespace detail {

inline ValidationError check_cds(const CdsTimeCode& code) noexcept {
    if (auto err = code.format.validate(); err != ValidationError::none) {
        return err;
    }
    if (code.day > code.format.max_day() || code.ms_of_day >= cds_max_ms_of_day) {
        return ValidationError::value_out_of_range;
    }
    switch (code.format.resolution) {
        case CdsResolution::milliseconds:
            if (code.submillisecond != 0) {
                return ValidationError::value_out_of_range;
            }
            break;
        case CdsResolution::microseconds:
            if (code.submillisecond >= cds_microseconds_per_ms) {
                return ValidationError::value_out_of_range;
            }
            break;
        case CdsResolution::picoseconds:
            if (code.submillisecond >= cds_picoseconds_per_ms) {
                return ValidationError::value_out_of_range;
            }
            break;
    }
    return ValidationError::none;
}

inline void put_cds_t_field(std::vector<uint8_t>& out, const CdsTimeCode& code) {
    ByteWriter writer(out);
    writer.put_uint(code.format.day_bytes(), code.day);
    writer.put_u32(code.ms_of_day);
    if (code.format.submillisecond_bytes() > 0) {
        writer.put_uint(code.format.submillisecond_bytes(), code.submillisecond);
    }
}

} // namespace detail

// P-field followed by T-field
inline Result<std::vector<uint8_t>> encode_cds(const CdsTimeCode& code) {
    if (auto err = detail::check_cds(code); err != ValidationError::none) {
        return err;
    }
    std::vector<uint8_t> out;
    out.reserve(code.format.encoded_length());
    out.push_back(code.format.p_field());
    detail::put_cds_t_field(out, code);
    return out;
}

// T-field only, for formats agreed out of band
inline Result<std::vector<uint8_t>> encode_cds_t_field(const CdsTimeCode& code) {
    if (auto err = detail::check_cds(code); err != ValidationError::none) {
        return err;
    }
    std::vector<uint8_t> out;
    out.reserve(code.format.t_field_length());
    detail::put_cds_t_field(out, code);
    return out;
}

inline Result<CdsTimeCode> decode_cds_t_field(std::span<const uint8_t> bytes,
                                              const CdsFormat& format) noexcept {
    if (auto err = format.validate(); err != ValidationError::none) {
        return err;
    }
    detail::ByteReader reader(bytes);
    CdsTimeCode code;
    code.format = format;
    uint64_t day = 0;
    uint64_t sub = 0;
    if (!reader.read_uint(format.day_bytes(), day) || !reader.read_u32(code.ms_of_day)) {
        return ValidationError::buffer_underflow;
    }
    if (format.submillisecond_bytes() > 0 &&
        !reader.read_uint(format.submillisecond_bytes(), sub)) {
        return ValidationError::buffer_underflow;
    }
    code.day = static_cast<uint32_t>(day);
    code.submillisecond = static_cast<uint32_t>(sub);
    return code;
}

/**
 * @brief Decode a P-field and the T-field it describes
 * @return Value, or invalid_p_field / buffer_underflow
 */
inline Result<CdsTimeCode> decode_cds(std::span<const uint8_t> bytes) noexcept {
    if (bytes.empty()) {
        return ValidationError::buffer_underflow;
    }
    auto format = decode_cds_p_field(bytes[0]);
    if (!format.ok()) {
        return format.error();
    }
    return decode_cds_t_field(bytes.subspan(1), *format);
}

} // namespace ccsdsio
