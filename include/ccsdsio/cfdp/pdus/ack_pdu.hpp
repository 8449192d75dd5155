#pragma once

#include <cstdint>
#include <span>

#include "../../core/detail/byte_stream.hpp"
#include "../../core/result.hpp"
#include "../../core/types.hpp"
#include "../config.hpp"
#include "../defs.hpp"
#include "../pdu_header.hpp"
#include "pdu_fields.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief ACK PDU (directive 06h)
 *
 * acknowledged directive(4) | subtype(4), condition(4) | spare(2) | status(2)
 *
 * Only EOF and Finished PDUs are acknowledged. The subtype is 0001b when
 * acknowledging a Finished PDU and 0000b otherwise.
 */
struct AckPdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::ack;

    DirectiveCode acknowledged_directive = DirectiveCode::eof;
    uint8_t directive_subtype = 0;
    ConditionCode condition = ConditionCode::no_error;
    TransactionStatus transaction_status = TransactionStatus::active;

    static constexpr uint8_t subtype_for(DirectiveCode acknowledged) noexcept {
        return acknowledged == DirectiveCode::finished ? 1 : 0;
    }

    // ACK for the given PDU with the matching subtype
    static AckPdu acknowledging(DirectiveCode acknowledged, ConditionCode cc,
                                TransactionStatus status) noexcept {
        AckPdu pdu;
        pdu.acknowledged_directive = acknowledged;
        pdu.directive_subtype = subtype_for(acknowledged);
        pdu.condition = cc;
        pdu.transaction_status = status;
        return pdu;
    }

    ValidationError encode(const PduHeader& /*header*/,
                           ccsdsio::detail::ByteWriter& writer) const {
        if (acknowledged_directive != DirectiveCode::eof &&
            acknowledged_directive != DirectiveCode::finished) {
            return ValidationError::invalid_field_value;
        }
        if (directive_subtype > 0x0F || !detail::fits_in_bits(condition, 4) ||
            !detail::fits_in_bits(transaction_status, 2)) {
            return ValidationError::value_too_large;
        }
        writer.put_u8(static_cast<uint8_t>((static_cast<uint8_t>(acknowledged_directive) << 4) |
                                           directive_subtype));
        writer.put_u8(static_cast<uint8_t>((static_cast<uint8_t>(condition) << 4) |
                                           static_cast<uint8_t>(transaction_status)));
        return ValidationError::none;
    }

    static Result<AckPdu> decode(std::span<const uint8_t> params, const PduHeader& /*header*/,
                                 const CfdpConfig& config) {
        ccsdsio::detail::ByteReader reader(params);
        uint8_t directive = 0;
        uint8_t status = 0;
        if (!reader.read_u8(directive) || !reader.read_u8(status)) {
            return ValidationError::buffer_underflow;
        }
        if (!reader.empty()) {
            return ValidationError::trailing_data;
        }

        AckPdu pdu;
        pdu.acknowledged_directive = static_cast<DirectiveCode>(directive >> 4);
        pdu.directive_subtype = static_cast<uint8_t>(directive & 0x0F);
        if (pdu.acknowledged_directive != DirectiveCode::eof &&
            pdu.acknowledged_directive != DirectiveCode::finished) {
            return ValidationError::invalid_field_value;
        }
        if (auto err = detail::check_reserved(config, (status & 0x0C) != 0, "ACK PDU spare bits");
            err != ValidationError::none) {
            return err;
        }
        pdu.condition = static_cast<ConditionCode>(status >> 4);
        pdu.transaction_status = static_cast<TransactionStatus>(status & 0x03);
        return pdu;
    }

    bool operator==(const AckPdu&) const = default;
};

} // namespace ccsdsio::cfdp
