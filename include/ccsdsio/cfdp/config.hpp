#pragma once

#include <cstddef>
#include <cstdint>

#include "../core/diagnostics.hpp"
#include "../core/types.hpp"

namespace ccsdsio::cfdp {

enum class CrcAlgorithm : uint8_t {
    crc16_ccitt = 0, // CRC-16/CCITT-FALSE, 2 trailing bytes
    crc32 = 1,       // CRC-32 (IEEE 802.3), 4 trailing bytes
};

constexpr size_t crc_length(CrcAlgorithm algorithm) noexcept {
    return algorithm == CrcAlgorithm::crc32 ? 4 : 2;
}

// Handling of nonzero spare and reserved bits on decode
enum class ReservedFieldPolicy : uint8_t {
    reject = 0, // Fail the decode with invalid_field_value
    warn = 1,   // Report to the diagnostic sink and continue
};

// Entity ids and sequence numbers are 1, 2, 4 or 8 bytes wide
constexpr bool is_valid_field_width(size_t width) noexcept {
    return width == 1 || width == 2 || width == 4 || width == 8;
}

/**
 * @brief PDU codec configuration
 *
 * Passed explicitly to every PduCodec; nothing is read from global state.
 * The sink is not owned and must outlive any codec using this configuration.
 */
struct CfdpConfig {
    CrcAlgorithm crc_algorithm = CrcAlgorithm::crc16_ccitt;
    uint8_t default_entity_id_width = 2;
    uint8_t default_sequence_number_width = 2;
    ReservedFieldPolicy reserved_fields = ReservedFieldPolicy::reject;
    DiagnosticSink* sink = nullptr;

    constexpr ValidationError validate() const noexcept {
        if (static_cast<uint8_t>(crc_algorithm) > 1 ||
            static_cast<uint8_t>(reserved_fields) > 1 ||
            !is_valid_field_width(default_entity_id_width) ||
            !is_valid_field_width(default_sequence_number_width)) {
            return ValidationError::invalid_configuration;
        }
        return ValidationError::none;
    }
};

} // namespace ccsdsio::cfdp
