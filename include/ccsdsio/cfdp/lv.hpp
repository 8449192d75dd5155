#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "../core/detail/byte_stream.hpp"
#include "../core/types.hpp"

namespace ccsdsio::cfdp {

// LV and TLV values are limited by their one-octet length field
inline constexpr size_t max_lv_value_length = 255;

/**
 * @brief Append a length-value field
 * @return none, or value_too_large for values longer than 255 bytes
 */
inline ValidationError put_lv(ccsdsio::detail::ByteWriter& writer,
                              std::span<const uint8_t> value) {
    if (value.size() > max_lv_value_length) {
        return ValidationError::value_too_large;
    }
    writer.put_u8(static_cast<uint8_t>(value.size()));
    writer.put_bytes(value);
    return ValidationError::none;
}

inline ValidationError put_lv(ccsdsio::detail::ByteWriter& writer, std::string_view value) {
    return put_lv(writer, std::span<const uint8_t>(
                              reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

/**
 * @brief Read a length-value field
 * @return none, or buffer_underflow when fewer bytes remain than declared
 */
inline ValidationError read_lv(ccsdsio::detail::ByteReader& reader,
                               std::span<const uint8_t>& value) noexcept {
    uint8_t length = 0;
    if (!reader.read_u8(length) || !reader.read_bytes(length, value)) {
        return ValidationError::buffer_underflow;
    }
    return ValidationError::none;
}

inline ValidationError read_lv(ccsdsio::detail::ByteReader& reader, std::string& value) {
    std::span<const uint8_t> bytes;
    if (auto err = read_lv(reader, bytes); err != ValidationError::none) {
        return err;
    }
    value.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return ValidationError::none;
}

// Encoded size of an LV holding value
constexpr size_t lv_length(std::string_view value) noexcept {
    return 1 + value.size();
}

} // namespace ccsdsio::cfdp
