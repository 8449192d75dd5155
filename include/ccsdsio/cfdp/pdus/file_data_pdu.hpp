#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "../../core/detail/byte_stream.hpp"
#include "../../core/result.hpp"
#include "../../core/types.hpp"
#include "../config.hpp"
#include "../defs.hpp"
#include "../pdu_header.hpp"
#include "pdu_fields.hpp"

namespace ccsdsio::cfdp {

// Segment metadata values are limited by their 6-bit length field
inline constexpr size_t max_segment_metadata_length = 63;

struct SegmentMetadata {
    RecordContinuationState record_continuation = RecordContinuationState::neither_start_nor_end;
    std::vector<uint8_t> metadata;

    bool operator==(const SegmentMetadata&) const = default;
};

/**
 * @brief File-Data PDU data field
 *
 * [rcs(2) | metadata length(6), metadata], offset, file data
 *
 * Segment metadata is present exactly when the header's segment metadata
 * flag is set. The codec rejects a mismatch between the two on encode.
 */
struct FileDataPdu {
    uint64_t offset = 0;
    std::vector<uint8_t> data;
    std::optional<SegmentMetadata> segment_metadata;

    ValidationError encode(const PduHeader& header, ccsdsio::detail::ByteWriter& writer) const {
        if (segment_metadata.has_value() != header.segment_metadata_flag) {
            return ValidationError::invalid_field_value;
        }
        if (segment_metadata) {
            if (segment_metadata->metadata.size() > max_segment_metadata_length ||
                !detail::fits_in_bits(segment_metadata->record_continuation, 2)) {
                return ValidationError::value_too_large;
            }
            writer.put_u8(static_cast<uint8_t>(
                (static_cast<uint8_t>(segment_metadata->record_continuation) << 6) |
                segment_metadata->metadata.size()));
            writer.put_bytes(segment_metadata->metadata);
        }
        if (auto err = detail::put_file_size(writer, header, offset);
            err != ValidationError::none) {
            return err;
        }
        writer.put_bytes(data);
        return ValidationError::none;
    }

    static Result<FileDataPdu> decode(std::span<const uint8_t> field, const PduHeader& header,
                                      const CfdpConfig& /*config*/) {
        ccsdsio::detail::ByteReader reader(field);
        FileDataPdu pdu;
        if (header.segment_metadata_flag) {
            uint8_t flags = 0;
            std::span<const uint8_t> metadata;
            if (!reader.read_u8(flags) || !reader.read_bytes(flags & 0x3F, metadata)) {
                return ValidationError::buffer_underflow;
            }
            SegmentMetadata segment;
            segment.record_continuation = static_cast<RecordContinuationState>(flags >> 6);
            segment.metadata.assign(metadata.begin(), metadata.end());
            pdu.segment_metadata = std::move(segment);
        }
        if (!detail::read_file_size(reader, header, pdu.offset)) {
            return ValidationError::buffer_underflow;
        }
        auto rest = reader.rest();
        pdu.data.assign(rest.begin(), rest.end());
        return pdu;
    }

    bool operator==(const FileDataPdu&) const = default;
};

} // namespace ccsdsio::cfdp
