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

// Prompt PDU (directive 09h): response required(1) | spare(7)
struct PromptPdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::prompt;

    PromptResponse response = PromptResponse::nak;

    ValidationError encode(const PduHeader& /*header*/,
                           ccsdsio::detail::ByteWriter& writer) const {
        if (!detail::fits_in_bits(response, 1)) {
            return ValidationError::value_too_large;
        }
        writer.put_u8(static_cast<uint8_t>(static_cast<uint8_t>(response) << 7));
        return ValidationError::none;
    }

    static Result<PromptPdu> decode(std::span<const uint8_t> params, const PduHeader& /*header*/,
                                    const CfdpConfig& config) {
        ccsdsio::detail::ByteReader reader(params);
        uint8_t flags = 0;
        if (!reader.read_u8(flags)) {
            return ValidationError::buffer_underflow;
        }
        if (!reader.empty()) {
            return ValidationError::trailing_data;
        }
        if (auto err = detail::check_reserved(config, (flags & 0x7F) != 0, "Prompt PDU spare bits");
            err != ValidationError::none) {
            return err;
        }
        PromptPdu pdu;
        pdu.response = static_cast<PromptResponse>(flags >> 7);
        return pdu;
    }

    bool operator==(const PromptPdu&) const = default;
};

} // namespace ccsdsio::cfdp
