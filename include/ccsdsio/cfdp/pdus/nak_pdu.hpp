#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "../../core/detail/byte_stream.hpp"
#include "../../core/result.hpp"
#include "../../core/types.hpp"
#include "../config.hpp"
#include "../defs.hpp"
#include "../pdu_header.hpp"
#include "pdu_fields.hpp"

namespace ccsdsio::cfdp {

// Missing file data between two offsets, end exclusive
struct SegmentRequest {
    uint64_t start_offset = 0;
    uint64_t end_offset = 0;

    bool operator==(const SegmentRequest&) const = default;
};

/**
 * @brief NAK PDU (directive 08h)
 *
 * start of scope, end of scope, then (start, end) segment request pairs.
 * Every offset is a file size field.
 */
struct NakPdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::nak;

    uint64_t start_of_scope = 0;
    uint64_t end_of_scope = 0;
    std::vector<SegmentRequest> segment_requests;

    ValidationError encode(const PduHeader& header, ccsdsio::detail::ByteWriter& writer) const {
        if (auto err = detail::put_file_size(writer, header, start_of_scope);
            err != ValidationError::none) {
            return err;
        }
        if (auto err = detail::put_file_size(writer, header, end_of_scope);
            err != ValidationError::none) {
            return err;
        }
        for (const auto& request : segment_requests) {
            if (auto err = detail::put_file_size(writer, header, request.start_offset);
                err != ValidationError::none) {
                return err;
            }
            if (auto err = detail::put_file_size(writer, header, request.end_offset);
                err != ValidationError::none) {
                return err;
            }
        }
        return ValidationError::none;
    }

    static Result<NakPdu> decode(std::span<const uint8_t> params, const PduHeader& header,
                                 const CfdpConfig& /*config*/) {
        ccsdsio::detail::ByteReader reader(params);
        NakPdu pdu;
        if (!detail::read_file_size(reader, header, pdu.start_of_scope) ||
            !detail::read_file_size(reader, header, pdu.end_of_scope)) {
            return ValidationError::buffer_underflow;
        }
        size_t pair_bytes = 2 * header.file_size_bytes();
        if (reader.remaining() % pair_bytes != 0) {
            return ValidationError::trailing_data;
        }
        while (!reader.empty()) {
            SegmentRequest request;
            if (!detail::read_file_size(reader, header, request.start_offset) ||
                !detail::read_file_size(reader, header, request.end_offset)) {
                return ValidationError::buffer_underflow;
            }
            pdu.segment_requests.push_back(request);
        }
        return pdu;
    }

    bool operator==(const NakPdu&) const = default;
};

} // namespace ccsdsio::cfdp
