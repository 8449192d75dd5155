#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../../core/detail/byte_stream.hpp"
#include "../../core/result.hpp"
#include "../../core/types.hpp"
#include "../config.hpp"
#include "../defs.hpp"
#include "../lv.hpp"
#include "../pdu_header.hpp"
#include "../tlv.hpp"
#include "../tlv_types.hpp"
#include "pdu_fields.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief Metadata PDU (directive 07h)
 *
 * reserved(1) | closure requested(1) | reserved(2) | checksum type(4),
 * file size, source file name LV, destination file name LV, option TLVs
 *
 * Options are kept as raw TLVs in wire order; typed_options() converts the
 * ones of a particular kind.
 */
struct MetadataPdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::metadata;

    bool closure_requested = false;
    ChecksumType checksum_type = ChecksumType::modular;
    uint64_t file_size = 0;
    std::string source_file_name;
    std::string destination_file_name;
    std::vector<Tlv> options;

    // Options convertible to TypedTlv, e.g. FilestoreRequestTlv or MessageToUserTlv
    template <typename TypedTlv>
    std::vector<TypedTlv> typed_options() const {
        std::vector<TypedTlv> out;
        for (const auto& option : options) {
            auto typed = TypedTlv::from_tlv(option);
            if (typed.ok()) {
                out.push_back(std::move(*typed));
            }
        }
        return out;
    }

    template <typename TypedTlv>
    ValidationError add_option(const TypedTlv& typed) {
        auto tlv = typed.to_tlv();
        if (!tlv.ok()) {
            return tlv.error();
        }
        options.push_back(std::move(*tlv));
        return ValidationError::none;
    }

    ValidationError encode(const PduHeader& header, ccsdsio::detail::ByteWriter& writer) const {
        if (static_cast<uint8_t>(checksum_type) > 0x0F) {
            return ValidationError::value_too_large;
        }
        writer.put_u8(static_cast<uint8_t>(((closure_requested ? 1 : 0) << 6) |
                                           static_cast<uint8_t>(checksum_type)));
        if (auto err = detail::put_file_size(writer, header, file_size);
            err != ValidationError::none) {
            return err;
        }
        if (auto err = put_lv(writer, source_file_name); err != ValidationError::none) {
            return err;
        }
        if (auto err = put_lv(writer, destination_file_name); err != ValidationError::none) {
            return err;
        }
        return put_tlv_list(writer, options);
    }

    static Result<MetadataPdu> decode(std::span<const uint8_t> params, const PduHeader& header,
                                      const CfdpConfig& config) {
        ccsdsio::detail::ByteReader reader(params);
        MetadataPdu pdu;
        uint8_t flags = 0;
        if (!reader.read_u8(flags) || !detail::read_file_size(reader, header, pdu.file_size)) {
            return ValidationError::buffer_underflow;
        }
        if (auto err = detail::check_reserved(config, (flags & 0xB0) != 0,
                                              "Metadata PDU reserved bits");
            err != ValidationError::none) {
            return err;
        }
        pdu.closure_requested = (flags & 0x40) != 0;
        pdu.checksum_type = static_cast<ChecksumType>(flags & 0x0F);
        if (auto err = read_lv(reader, pdu.source_file_name); err != ValidationError::none) {
            return err;
        }
        if (auto err = read_lv(reader, pdu.destination_file_name); err != ValidationError::none) {
            return err;
        }
        if (auto err = read_tlv_list(reader, pdu.options); err != ValidationError::none) {
            return err;
        }
        return pdu;
    }

    bool operator==(const MetadataPdu&) const = default;
};

} // namespace ccsdsio::cfdp
