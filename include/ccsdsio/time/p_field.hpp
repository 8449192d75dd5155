#pragma once

#include <cstdint>

namespace ccsdsio {

// Time code identification, P-field bits 6-4 (CCSDS 301.0-B-4)
enum class TimeCodeId : uint8_t {
    cuc_level1 = 0b001, // CUC with the 1958 epoch
    cuc_level2 = 0b010, // CUC with an agency-defined epoch
    cds = 0b100,        // Day segmented
    ccs = 0b101,        // Calendar segmented (not supported)
};

inline constexpr uint8_t p_field_extension_bit = 0x80;

// Time code id carried by a single-octet P-field
constexpr TimeCodeId p_field_time_code_id(uint8_t p_field) noexcept {
    return static_cast<TimeCodeId>((p_field >> 4) & 0x07);
}

constexpr bool p_field_extended(uint8_t p_field) noexcept {
    return (p_field & p_field_extension_bit) != 0;
}

} // namespace ccsdsio
