#pragma once

#include <cstddef>
#include <cstdint>

namespace ccsdsio::detail {

/**
 * @brief Big-endian buffer read/write helpers
 *
 * Single source of truth for moving integers between host values and
 * big-endian packet buffers. Values are assembled octet by octet, so the
 * result does not depend on host byte order or buffer alignment.
 */

/**
 * Read an unsigned big-endian integer of 1..8 bytes
 * @param buffer Pointer to buffer
 * @param offset Byte offset into buffer
 * @param width Number of bytes (1..8)
 * @return Value in host byte order
 */
constexpr uint64_t read_uint(const uint8_t* buffer, size_t offset, size_t width) noexcept {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | buffer[offset + i];
    }
    return value;
}

/**
 * Write an unsigned big-endian integer of 1..8 bytes
 *
 * Only the low (8 * width) bits of value are written.
 */
constexpr void write_uint(uint8_t* buffer, size_t offset, size_t width, uint64_t value) noexcept {
    for (size_t i = width; i > 0; --i) {
        buffer[offset + i - 1] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

inline uint16_t read_u16(const uint8_t* buffer, size_t offset) noexcept {
    return static_cast<uint16_t>(read_uint(buffer, offset, 2));
}

inline uint32_t read_u32(const uint8_t* buffer, size_t offset) noexcept {
    return static_cast<uint32_t>(read_uint(buffer, offset, 4));
}

inline uint64_t read_u64(const uint8_t* buffer, size_t offset) noexcept {
    return read_uint(buffer, offset, 8);
}

inline void write_u16(uint8_t* buffer, size_t offset, uint16_t value) noexcept {
    write_uint(buffer, offset, 2, value);
}

inline void write_u32(uint8_t* buffer, size_t offset, uint32_t value) noexcept {
    write_uint(buffer, offset, 4, value);
}

inline void write_u64(uint8_t* buffer, size_t offset, uint64_t value) noexcept {
    write_uint(buffer, offset, 8, value);
}

// True when value can be represented in width bytes
constexpr bool fits_in_bytes(uint64_t value, size_t width) noexcept {
    return width >= 8 || value < (uint64_t{1} << (8 * width));
}

// Minimum number of bytes (at least 1) needed to hold value
constexpr size_t min_byte_width(uint64_t value) noexcept {
    size_t width = 1;
    while (width < 8 && !fits_in_bytes(value, width)) {
        ++width;
    }
    return width;
}

} // namespace ccsdsio::detail
