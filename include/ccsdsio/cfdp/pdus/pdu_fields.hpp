#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "../../core/detail/buffer_io.hpp"
#include "../../core/detail/byte_stream.hpp"
#include "../../core/diagnostics.hpp"
#include "../../core/types.hpp"
#include "../config.hpp"
#include "../pdu_header.hpp"
#include "../tlv.hpp"
#include "../tlv_types.hpp"

namespace ccsdsio::cfdp::detail {

// File size, offset, scope and progress fields follow the large file flag
inline ValidationError put_file_size(ccsdsio::detail::ByteWriter& writer, const PduHeader& header,
                                     uint64_t value) {
    if (!ccsdsio::detail::fits_in_bytes(value, header.file_size_bytes())) {
        return ValidationError::value_too_large;
    }
    writer.put_uint(header.file_size_bytes(), value);
    return ValidationError::none;
}

inline bool read_file_size(ccsdsio::detail::ByteReader& reader, const PduHeader& header,
                           uint64_t& value) noexcept {
    return reader.read_uint(header.file_size_bytes(), value);
}

/**
 * @brief Apply the reserved field policy to a spare or reserved field
 * @param nonzero Whether the field carried a nonzero value
 * @return invalid_field_value under the reject policy, none otherwise
 */
inline ValidationError check_reserved(const CfdpConfig& config, bool nonzero,
                                      std::string_view field) noexcept {
    if (!nonzero) {
        return ValidationError::none;
    }
    if (config.reserved_fields == ReservedFieldPolicy::reject) {
        return ValidationError::invalid_field_value;
    }
    ccsdsio::detail::report(config.sink, Severity::warning, ValidationError::invalid_field_value,
                            field);
    return ValidationError::none;
}

// Fault location TLVs accompany a condition code other than no_error only
inline ValidationError put_fault_location(ccsdsio::detail::ByteWriter& writer,
                                          ConditionCode condition,
                                          const std::optional<EntityIdTlv>& fault_location) {
    if (!fault_location) {
        return ValidationError::none;
    }
    if (condition == ConditionCode::no_error) {
        return ValidationError::invalid_field_value;
    }
    auto tlv = fault_location->to_tlv();
    if (!tlv.ok()) {
        return tlv.error();
    }
    return put_tlv(writer, *tlv);
}

inline ValidationError read_fault_location(ccsdsio::detail::ByteReader& reader,
                                           ConditionCode condition,
                                           std::optional<EntityIdTlv>& fault_location) {
    if (reader.empty()) {
        return ValidationError::none;
    }
    Tlv tlv;
    if (auto err = read_tlv(reader, tlv); err != ValidationError::none) {
        return err;
    }
    auto entity = EntityIdTlv::from_tlv(tlv);
    if (!entity.ok()) {
        return entity.error();
    }
    if (condition == ConditionCode::no_error) {
        return ValidationError::invalid_field_value;
    }
    fault_location = *entity;
    return ValidationError::none;
}

} // namespace ccsdsio::cfdp::detail
