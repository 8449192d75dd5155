#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "result.hpp"
#include "types.hpp"

namespace ccsdsio {

inline constexpr size_t max_bit_field_width = 64;

namespace detail {

constexpr uint64_t low_bits_mask(size_t width) noexcept {
    return width >= 64 ? ~uint64_t{0} : ((uint64_t{1} << width) - 1);
}

constexpr ValidationError check_bit_field(size_t buffer_bytes, size_t bit_offset,
                                          size_t width) noexcept {
    if (width == 0 || width > max_bit_field_width) {
        return ValidationError::invalid_configuration;
    }
    size_t buffer_bits = buffer_bytes * 8;
    if (bit_offset > buffer_bits || width > buffer_bits - bit_offset) {
        return ValidationError::out_of_range;
    }
    return ValidationError::none;
}

} // namespace detail

/**
 * @brief Read an unsigned bit field in big-endian bit order
 *
 * Bit 0 is the most significant bit of the first byte. The field may start
 * and end at any bit position.
 *
 * @param buffer Source bytes
 * @param bit_offset Offset of the field's most significant bit
 * @param width Field width in bits (1..64)
 * @return Field value, or out_of_range / invalid_configuration
 */
inline Result<uint64_t> read_bits(std::span<const uint8_t> buffer, size_t bit_offset,
                                  size_t width) noexcept {
    auto err = detail::check_bit_field(buffer.size(), bit_offset, width);
    if (err != ValidationError::none) {
        return err;
    }

    uint64_t value = 0;
    size_t pos = bit_offset;
    size_t left = width;
    while (left > 0) {
        size_t byte_index = pos / 8;
        size_t bit_in_byte = pos % 8;
        size_t take = 8 - bit_in_byte;
        if (take > left) {
            take = left;
        }
        uint8_t byte = buffer[byte_index];
        uint8_t chunk = static_cast<uint8_t>((byte >> (8 - bit_in_byte - take)) &
                                             detail::low_bits_mask(take));
        value = (value << take) | chunk;
        pos += take;
        left -= take;
    }
    return value;
}

/**
 * @brief Write an unsigned bit field in big-endian bit order
 *
 * Bits outside the field are preserved. On error the buffer is not modified.
 *
 * @return none, out_of_range, value_too_large or invalid_configuration
 */
inline ValidationError write_bits(std::span<uint8_t> buffer, size_t bit_offset, size_t width,
                                  uint64_t value) noexcept {
    auto err = detail::check_bit_field(buffer.size(), bit_offset, width);
    if (err != ValidationError::none) {
        return err;
    }
    if ((value & ~detail::low_bits_mask(width)) != 0) {
        return ValidationError::value_too_large;
    }

    size_t pos = bit_offset;
    size_t left = width;
    while (left > 0) {
        size_t byte_index = pos / 8;
        size_t bit_in_byte = pos % 8;
        size_t take = 8 - bit_in_byte;
        if (take > left) {
            take = left;
        }
        size_t shift = 8 - bit_in_byte - take;
        auto mask = static_cast<uint8_t>(detail::low_bits_mask(take) << shift);
        auto chunk = static_cast<uint8_t>(((value >> (left - take)) & detail::low_bits_mask(take))
                                          << shift);
        buffer[byte_index] = static_cast<uint8_t>((buffer[byte_index] & ~mask) | chunk);
        pos += take;
        left -= take;
    }
    return ValidationError::none;
}

} // namespace ccsdsio
