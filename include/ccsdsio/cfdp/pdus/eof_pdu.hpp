#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "../../core/detail/byte_stream.hpp"
#include "../../core/result.hpp"
#include "../../core/types.hpp"
#include "../config.hpp"
#include "../defs.hpp"
#include "../pdu_header.hpp"
#include "../tlv_types.hpp"
#include "pdu_fields.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief End-of-file PDU (directive 04h)
 *
 * condition(4) | spare(4), file checksum(32), file size, [fault location TLV]
 */
struct EofPdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::eof;

    ConditionCode condition = ConditionCode::no_error;
    uint32_t checksum = 0;
    uint64_t file_size = 0;
    std::optional<EntityIdTlv> fault_location;

    ValidationError encode(const PduHeader& header, ccsdsio::detail::ByteWriter& writer) const {
        if (!detail::fits_in_bits(condition, 4)) {
            return ValidationError::value_too_large;
        }
        writer.put_u8(static_cast<uint8_t>(static_cast<uint8_t>(condition) << 4));
        writer.put_u32(checksum);
        if (auto err = detail::put_file_size(writer, header, file_size);
            err != ValidationError::none) {
            return err;
        }
        return detail::put_fault_location(writer, condition, fault_location);
    }

    static Result<EofPdu> decode(std::span<const uint8_t> params, const PduHeader& header,
                                 const CfdpConfig& config) {
        ccsdsio::detail::ByteReader reader(params);
        EofPdu pdu;
        uint8_t flags = 0;
        if (!reader.read_u8(flags) || !reader.read_u32(pdu.checksum) ||
            !detail::read_file_size(reader, header, pdu.file_size)) {
            return ValidationError::buffer_underflow;
        }
        if (auto err = detail::check_reserved(config, (flags & 0x0F) != 0, "EOF PDU spare bits");
            err != ValidationError::none) {
            return err;
        }
        pdu.condition = static_cast<ConditionCode>(flags >> 4);
        if (auto err = detail::read_fault_location(reader, pdu.condition, pdu.fault_location);
            err != ValidationError::none) {
            return err;
        }
        if (!reader.empty()) {
            return ValidationError::trailing_data;
        }
        return pdu;
    }

    bool operator==(const EofPdu&) const = default;
};

} // namespace ccsdsio::cfdp
