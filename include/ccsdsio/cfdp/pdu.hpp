#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

#include "../core/detail/byte_stream.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "config.hpp"
#include "defs.hpp"
#include "pdu_header.hpp"
#include "pdus/ack_pdu.hpp"
#include "pdus/eof_pdu.hpp"
#include "pdus/file_data_pdu.hpp"
#include "pdus/finished_pdu.hpp"
#include "pdus/keep_alive_pdu.hpp"
#include "pdus/metadata_pdu.hpp"
#include "pdus/nak_pdu.hpp"
#include "pdus/prompt_pdu.hpp"

namespace ccsdsio::cfdp {

/**
 * @brief File directive with a code this library does not interpret
 *
 * Keeps the raw parameter bytes so the PDU can be forwarded or re-encoded
 * unchanged.
 */
struct UnknownDirectivePdu {
    uint8_t directive_code = 0;
    std::vector<uint8_t> parameters;

    ValidationError encode(const PduHeader& /*header*/,
                           ccsdsio::detail::ByteWriter& writer) const {
        writer.put_bytes(parameters);
        return ValidationError::none;
    }

    bool operator==(const UnknownDirectivePdu&) const = default;
};

using PduBody = std::variant<MetadataPdu, FileDataPdu, EofPdu, AckPdu, NakPdu, FinishedPdu,
                             PromptPdu, KeepAlivePdu, UnknownDirectivePdu>;

struct Pdu {
    PduHeader header;
    PduBody body;

    bool is_file_data() const noexcept { return std::holds_alternative<FileDataPdu>(body); }

    // Directive code octet, or nullopt for a File-Data PDU
    std::optional<uint8_t> directive_code() const noexcept {
        return std::visit(
            [](const auto& b) -> std::optional<uint8_t> {
                using B = std::decay_t<decltype(b)>;
                if constexpr (std::is_same_v<B, FileDataPdu>) {
                    return std::nullopt;
                } else if constexpr (std::is_same_v<B, UnknownDirectivePdu>) {
                    return b.directive_code;
                } else {
                    return static_cast<uint8_t>(B::directive_code);
                }
            },
            body);
    }

    template <typename Body>
    const Body* get_if() const noexcept {
        return std::get_if<Body>(&body);
    }

    template <typename Body>
    Body* get_if() noexcept {
        return std::get_if<Body>(&body);
    }

    bool operator==(const Pdu&) const = default;
};

} // namespace ccsdsio::cfdp
