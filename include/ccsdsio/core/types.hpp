#pragma once

#include <cstddef>
#include <cstdint>

namespace ccsdsio {

// Space packet primary header size (CCSDS 133.0-B-2)
inline constexpr size_t space_packet_header_bytes = 6;

// Field limits of the space packet primary header
inline constexpr uint16_t max_apid = 0x7FF;
inline constexpr uint16_t sequence_count_modulus = 16384;
inline constexpr uint16_t max_sequence_count = sequence_count_modulus - 1;

// Packet data field holds 1..65536 bytes (length field stores size - 1)
inline constexpr size_t max_packet_data_bytes = 65536;

// Validation error codes shared by every codec
enum class ValidationError : uint8_t {
    none = 0,               // No error
    out_of_range,           // Bit field extends past the end of the buffer
    value_too_large,        // Value does not fit in its wire field
    truncated_header,       // Fewer bytes than the fixed header size
    reserved_version,       // Version bits carry a reserved value
    invalid_length_field,   // Length-of-field code maps to no legal width
    header_length_mismatch, // Declared length disagrees with bytes present
    buffer_underflow,       // Input ended before a declared field
    trailing_data,          // Bytes left over that cannot form a whole element
    unsupported_directive,  // Directive code outside the known PDU set
    crc_mismatch,           // Recomputed CRC differs from the transmitted one
    invalid_p_field,        // Time code preamble is malformed or reserved
    value_out_of_range,     // Value outside the representable range of a format
    invalid_configuration,  // Codec or format descriptor is inconsistent
    tlv_type_mismatch,      // TLV type code differs from the one expected
    invalid_field_value,    // Field holds a value the format forbids
    buffer_too_small,       // Output buffer cannot hold the encoded bytes
    pdu_type_mismatch,      // Header PDU type disagrees with the PDU body
};

// Broad grouping used by callers to decide whether a decode result is usable
enum class ErrorCategory : uint8_t {
    none = 0,      // No error
    structural,    // Input could not be parsed, no value is produced
    validation,    // Input parsed but violated a constraint
    configuration, // Caller-supplied configuration is unusable
};

// Convert validation error to human-readable string
constexpr const char* validation_error_string(ValidationError err) noexcept {
    switch (err) {
        case ValidationError::none:
            return "No error";
        case ValidationError::out_of_range:
            return "Bit field extends past the end of the buffer";
        case ValidationError::value_too_large:
            return "Value does not fit in its field width";
        case ValidationError::truncated_header:
            return "Buffer shorter than the fixed header";
        case ValidationError::reserved_version:
            return "Version field holds a reserved value";
        case ValidationError::invalid_length_field:
            return "Length-of-field code is not a legal width";
        case ValidationError::header_length_mismatch:
            return "Declared data field length doesn't match bytes present";
        case ValidationError::buffer_underflow:
            return "Buffer ended before a declared field";
        case ValidationError::trailing_data:
            return "Unconsumed trailing bytes";
        case ValidationError::unsupported_directive:
            return "Unsupported file directive code";
        case ValidationError::crc_mismatch:
            return "CRC mismatch";
        case ValidationError::invalid_p_field:
            return "Invalid time code preamble field";
        case ValidationError::value_out_of_range:
            return "Value outside the range of the format";
        case ValidationError::invalid_configuration:
            return "Invalid codec configuration";
        case ValidationError::tlv_type_mismatch:
            return "TLV type doesn't match expected type";
        case ValidationError::invalid_field_value:
            return "Field holds a forbidden value";
        case ValidationError::buffer_too_small:
            return "Output buffer too small";
        case ValidationError::pdu_type_mismatch:
            return "PDU type doesn't match PDU body";
        default:
            return "Unknown error";
    }
}

constexpr ErrorCategory error_category(ValidationError err) noexcept {
    switch (err) {
        case ValidationError::none:
            return ErrorCategory::none;
        case ValidationError::invalid_configuration:
            return ErrorCategory::configuration;
        case ValidationError::out_of_range:
        case ValidationError::truncated_header:
        case ValidationError::invalid_length_field:
        case ValidationError::header_length_mismatch:
        case ValidationError::buffer_underflow:
        case ValidationError::trailing_data:
        case ValidationError::invalid_p_field:
        case ValidationError::buffer_too_small:
            return ErrorCategory::structural;
        default:
            return ErrorCategory::validation;
    }
}

// Advisory errors keep the decoded value available to the caller
constexpr bool is_advisory(ValidationError err) noexcept {
    return err == ValidationError::crc_mismatch ||
           err == ValidationError::unsupported_directive;
}

} // namespace ccsdsio
