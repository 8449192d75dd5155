#pragma once

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
#include "../tlv.hpp"
#include "../tlv_types.hpp"
#include "pdu_fields.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief Finished PDU (directive 05h)
 *
 * condition(4) | spare(1) | delivery code(1) | file status(2),
 * filestore response TLVs, [fault location TLV]
 */
struct FinishedPdu {
    static constexpr DirectiveCode directive_code = DirectiveCode::finished;

    ConditionCode condition = ConditionCode::no_error;
    DeliveryCode delivery = DeliveryCode::data_complete;
    FileStatus file_status = FileStatus::unreported;
    std::vector<FilestoreResponseTlv> filestore_responses;
    std::optional<EntityIdTlv> fault_location;

    ValidationError encode(const PduHeader& /*header*/,
                           ccsdsio::detail::ByteWriter& writer) const {
        if (!detail::fits_in_bits(condition, 4) || !detail::fits_in_bits(delivery, 1) ||
            !detail::fits_in_bits(file_status, 2)) {
            return ValidationError::value_too_large;
        }
        writer.put_u8(static_cast<uint8_t>((static_cast<uint8_t>(condition) << 4) |
                                           (static_cast<uint8_t>(delivery) << 2) |
                                           static_cast<uint8_t>(file_status)));
        for (const auto& response : filestore_responses) {
            auto tlv = response.to_tlv();
            if (!tlv.ok()) {
                return tlv.error();
            }
            if (auto err = put_tlv(writer, *tlv); err != ValidationError::none) {
                return err;
            }
        }
        return detail::put_fault_location(writer, condition, fault_location);
    }

    static Result<FinishedPdu> decode(std::span<const uint8_t> params, const PduHeader& /*header*/,
                                      const CfdpConfig& config) {
        ccsdsio::detail::ByteReader reader(params);
        uint8_t flags = 0;
        if (!reader.read_u8(flags)) {
            return ValidationError::buffer_underflow;
        }
        if (auto err = detail::check_reserved(config, (flags & 0x08) != 0,
                                              "Finished PDU spare bit");
            err != ValidationError::none) {
            return err;
        }
        FinishedPdu pdu;
        pdu.condition = static_cast<ConditionCode>(flags >> 4);
        pdu.delivery = static_cast<DeliveryCode>((flags >> 2) & 0x01);
        pdu.file_status = static_cast<FileStatus>(flags & 0x03);

        std::vector<Tlv> tlvs;
        if (auto err = read_tlv_list(reader, tlvs); err != ValidationError::none) {
            return err;
        }
        for (size_t i = 0; i < tlvs.size(); ++i) {
            if (tlvs[i].is(TlvType::filestore_response)) {
                auto response = FilestoreResponseTlv::from_tlv(tlvs[i]);
                if (!response.ok()) {
                    return response.error();
                }
                pdu.filestore_responses.push_back(std::move(*response));
            } else if (tlvs[i].is(TlvType::entity_id) && i + 1 == tlvs.size()) {
                auto entity = EntityIdTlv::from_tlv(tlvs[i]);
                if (!entity.ok()) {
                    return entity.error();
                }
                if (pdu.condition == ConditionCode::no_error) {
                    return ValidationError::invalid_field_value;
                }
                pdu.fault_location = *entity;
            } else {
                return ValidationError::tlv_type_mismatch;
            }
        }
        return pdu;
    }

    bool operator==(const FinishedPdu&) const = default;
};

} // namespace ccsdsio::cfdp
