#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace ccsdsio {

namespace detail {

// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, no reflection, no final xor
constexpr std::array<uint16_t, 256> make_crc16_table() noexcept {
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        auto crc = static_cast<uint16_t>(i << 8);
        for (int bit = 0; bit < 8; ++bit) {
            crc = static_cast<uint16_t>((crc & 0x8000) ? ((crc << 1) ^ 0x1021) : (crc << 1));
        }
        table[i] = crc;
    }
    return table;
}

// CRC-32 (IEEE 802.3): reflected poly 0xEDB88320, init and final xor 0xFFFFFFFF
constexpr std::array<uint32_t, 256> make_crc32_table() noexcept {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? ((crc >> 1) ^ 0xEDB88320U) : (crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr auto crc16_table = make_crc16_table();
inline constexpr auto crc32_table = make_crc32_table();

} // namespace detail

inline constexpr uint16_t crc16_ccitt_false_init = 0xFFFF;

/**
 * @brief Continue a CRC-16/CCITT-FALSE computation
 *
 * Used for the space packet error control field and for CFDP PDU CRCs.
 * A buffer followed by its own CRC (big-endian) yields 0.
 */
constexpr uint16_t crc16_ccitt_false(std::span<const uint8_t> data,
                                     uint16_t crc = crc16_ccitt_false_init) noexcept {
    for (uint8_t byte : data) {
        crc = static_cast<uint16_t>((crc << 8) ^ detail::crc16_table[((crc >> 8) ^ byte) & 0xFF]);
    }
    return crc;
}

// CRC-32 (IEEE 802.3), check value 0xCBF43926 for "123456789"
constexpr uint32_t crc32(std::span<const uint8_t> data) noexcept {
    uint32_t crc = 0xFFFFFFFFU;
    for (uint8_t byte : data) {
        crc = (crc >> 8) ^ detail::crc32_table[(crc ^ byte) & 0xFF];
    }
    return crc ^ 0xFFFFFFFFU;
}

} // namespace ccsdsio
