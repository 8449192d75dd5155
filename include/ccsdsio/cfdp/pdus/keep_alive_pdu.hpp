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

// Keep Alive PDU (directive 0Ch): progress as a file size field
struct KeepAlivePdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::keep_alive;

    uint64_t progress = 0;

    ValidationError encode(const PduHeader& header, ccsdsio::detail::ByteWriter& writer) const {
        return detail::put_file_size(writer, header, progress);
    }

    static Result<KeepAlivePdu> decode(std::span<const uint8_t> params, const PduHeader& header,
                                       const CfdpConfig& /*config*/) {
        ccsdsio::detail::ByteReader reader(params);
        KeepAlivePdu pdu;
        if (!detail::read_file_size(reader, header, pdu.progress)) {
            return ValidationError::buffer_underflow;
        }
        if (!reader.empty()) {
            return ValidationError::trailing_data;
        }
        return pdu;
    }

    bool operator==(const KeepAlivePdu&) const = default;
};

} // namespace ccsdsio::cfdp
