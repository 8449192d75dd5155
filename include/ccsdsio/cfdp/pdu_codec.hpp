#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../core/crc.hpp"
#include "../core/detail/buffer_io.hpp"
#include "../core/detail/byte_stream.hpp"
#include "../core/diagnostics.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "config.hpp"
#include "defs.hpp"
#include "pdu.hpp"
#include "pdu_header.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief Encodes and decodes complete CFDP PDUs
 *
 * Owns a copy of its configuration. encode() fills in the data field length
 * and appends the CRC when the header's crc_flag is set; decode() checks
 * both and dispatches on the directive code.
 *
 * A CRC mismatch or an unknown directive code does not discard the decoded
 * PDU: the Result carries the value together with crc_mismatch or
 * unsupported_directive, and the condition is reported to the configured
 * sink.
 *
 * Example:
 * @code
 * PduCodec codec({.crc_algorithm = CrcAlgorithm::crc16_ccitt});
 * Pdu pdu{codec.make_header(PduType::file_directive, 1, 7, 2), EofPdu{}};
 * auto bytes = codec.encode(pdu);
 * auto back = codec.decode(*bytes);
 * @endcode
 */
class PduCodec {
public:
    explicit PduCodec(CfdpConfig config = {}) : config_(config) {
        if (validate(config_) != ValidationError::none) {
            throw std::invalid_argument(std::string("Invalid CFDP configuration: ") +
                                        validation_error_string(validate(config_)));
        }
    }

    static constexpr ValidationError validate(const CfdpConfig& config) noexcept {
        return config.validate();
    }

    const CfdpConfig& config() const noexcept { return config_; }

    size_t crc_length() const noexcept { return cfdp::crc_length(config_.crc_algorithm); }

    /**
     * @brief Header with the configured entity id and sequence number widths
     *
     * The data field length is left at zero; encode() computes it.
     */
    PduHeader make_header(PduType type, uint64_t source_entity_id, uint64_t sequence_number,
                          uint64_t destination_entity_id) const noexcept {
        PduHeader h;
        h.pdu_type = type;
        h.entity_id_width = config_.default_entity_id_width;
        h.sequence_number_width = config_.default_sequence_number_width;
        h.source_entity_id = source_entity_id;
        h.transaction_sequence_number = sequence_number;
        h.destination_entity_id = destination_entity_id;
        return h;
    }

    /**
     * @brief Encode a PDU
     * @return Encoded bytes, or pdu_type_mismatch when the header type does
     *         not match the body, or the first header/body field error
     */
    Result<std::vector<uint8_t>> encode(const Pdu& pdu) const {
        bool file_data = pdu.is_file_data();
        if ((pdu.header.pdu_type == PduType::file_data) != file_data) {
            return ValidationError::pdu_type_mismatch;
        }
        if (!file_data && pdu.header.segment_metadata_flag) {
            return ValidationError::invalid_field_value;
        }

        std::vector<uint8_t> data_field;
        ccsdsio::detail::ByteWriter body_writer(data_field);
        if (auto err = encode_body(pdu, body_writer); err != ValidationError::none) {
            return err;
        }

        size_t crc_bytes = pdu.header.crc_flag ? crc_length() : 0;
        size_t data_length = data_field.size() + crc_bytes;
        if (data_length > 0xFFFF) {
            return ValidationError::value_too_large;
        }

        PduHeader header = pdu.header;
        header.pdu_data_field_length = static_cast<uint16_t>(data_length);

        std::vector<uint8_t> out;
        out.reserve(header.pdu_length());
        if (auto err = encode_pdu_header(header, out); err != ValidationError::none) {
            return err;
        }
        out.insert(out.end(), data_field.begin(), data_field.end());
        if (header.crc_flag) {
            append_crc(out);
        }
        return out;
    }

    /**
     * @brief Encode a PDU into a caller-supplied buffer
     * @param written Set to the encoded length on success
     * @return none, buffer_too_small, or any error encode() returns
     */
    ValidationError encode_into(const Pdu& pdu, std::span<uint8_t> out, size_t& written) const {
        auto bytes = encode(pdu);
        if (!bytes.ok()) {
            return bytes.error();
        }
        if (bytes->size() > out.size()) {
            return ValidationError::buffer_too_small;
        }
        std::memcpy(out.data(), bytes->data(), bytes->size());
        written = bytes->size();
        return ValidationError::none;
    }

    /**
     * @brief Decode one PDU occupying exactly bytes
     *
     * Structural errors (truncated_header, header_length_mismatch,
     * buffer_underflow, ...) carry no value. unsupported_directive carries
     * the decoded PDU. Once the CRC fails the error is always crc_mismatch;
     * the PDU is carried when its body still decodes.
     */
    Result<Pdu> decode(std::span<const uint8_t> bytes) const {
        auto header = decode_pdu_header(bytes, config_);
        if (!header.ok()) {
            return header.error();
        }

        auto data_field = bytes.subspan(header->header_length());
        bool crc_failed = false;
        if (header->crc_flag) {
            size_t crc_bytes = crc_length();
            if (data_field.size() < crc_bytes) {
                return ValidationError::buffer_underflow;
            }
            size_t covered = bytes.size() - crc_bytes;
            uint32_t received =
                static_cast<uint32_t>(ccsdsio::detail::read_uint(bytes.data(), covered, crc_bytes));
            if (compute_crc(bytes.first(covered)) != received) {
                crc_failed = true;
                ccsdsio::detail::report(config_.sink, Severity::warning,
                                        ValidationError::crc_mismatch,
                                        "CFDP PDU CRC does not match its contents");
            }
            data_field = data_field.first(data_field.size() - crc_bytes);
        }

        auto body = decode_body(*header, data_field);
        if (!body.has_value()) {
            return crc_failed ? ValidationError::crc_mismatch : body.error();
        }

        Pdu pdu{*header, std::move(*body)};
        if (crc_failed) {
            return Result<Pdu>(std::move(pdu), ValidationError::crc_mismatch);
        }
        if (body.error() == ValidationError::unsupported_directive) {
            return Result<Pdu>(std::move(pdu), ValidationError::unsupported_directive);
        }
        return pdu;
    }

    // Total length of the PDU at the front of bytes, from its header
    static Result<size_t> pdu_length(std::span<const uint8_t> bytes) noexcept {
        return peek_pdu_length(bytes);
    }

private:
    ValidationError encode_body(const Pdu& pdu, ccsdsio::detail::ByteWriter& writer) const {
        return std::visit(
            [&](const auto& body) -> ValidationError {
                using B = std::decay_t<decltype(body)>;
                if constexpr (std::is_same_v<B, UnknownDirectivePdu>) {
                    if (is_known_directive(body.directive_code)) {
                        return ValidationError::invalid_field_value;
                    }
                    writer.put_u8(body.directive_code);
                } else if constexpr (!std::is_same_v<B, FileDataPdu>) {
                    writer.put_u8(static_cast<uint8_t>(B::directive_code));
                }
                return body.encode(pdu.header, writer);
            },
            pdu.body);
    }

    // Body alternative, with unsupported_directive attached for unknown codes
    Result<PduBody> decode_body(const PduHeader& header,
                                std::span<const uint8_t> data_field) const {
        if (header.pdu_type == PduType::file_data) {
            return wrap(FileDataPdu::decode(data_field, header, config_));
        }
        if (data_field.empty()) {
            return ValidationError::buffer_underflow;
        }
        uint8_t code = data_field[0];
        auto params = data_field.subspan(1);
        switch (static_cast<DirectiveCode>(code)) {
            case DirectiveCode::eof:
                return wrap(EofPdu::decode(params, header, config_));
            case DirectiveCode::finished:
                return wrap(FinishedPdu::decode(params, header, config_));
            case DirectiveCode::ack:
                return wrap(AckPdu::decode(params, header, config_));
            case DirectiveCode::metadata:
                return wrap(MetadataPdu::decode(params, header, config_));
            case DirectiveCode::nak:
                return wrap(NakPdu::decode(params, header, config_));
            case DirectiveCode::prompt:
                return wrap(PromptPdu::decode(params, header, config_));
            case DirectiveCode::keep_alive:
                return wrap(KeepAlivePdu::decode(params, header, config_));
            default:
                break;
        }

        ccsdsio::detail::report(config_.sink, Severity::warning,
                                ValidationError::unsupported_directive,
                                "CFDP directive code " + std::to_string(code) + " not recognized");
        UnknownDirectivePdu unknown;
        unknown.directive_code = code;
        unknown.parameters.assign(params.begin(), params.end());
        return Result<PduBody>(PduBody{std::move(unknown)},
                               ValidationError::unsupported_directive);
    }

    template <typename Body>
    static Result<PduBody> wrap(Result<Body> decoded) {
        if (!decoded.ok()) {
            return decoded.error();
        }
        return PduBody{std::move(decoded).value()};
    }

    uint32_t compute_crc(std::span<const uint8_t> covered) const noexcept {
        if (config_.crc_algorithm == CrcAlgorithm::crc32) {
            return crc32(covered);
        }
        return crc16_ccitt_false(covered);
    }

    void append_crc(std::vector<uint8_t>& out) const {
        uint32_t crc = compute_crc(out);
        ccsdsio::detail::ByteWriter writer(out);
        writer.put_uint(crc_length(), crc);
    }

    CfdpConfig config_;
};

} // namespace ccsdsio::cfdp
