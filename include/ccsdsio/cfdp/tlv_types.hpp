#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../core/detail/buffer_io.hpp"
#include "../core/detail/byte_stream.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "defs.hpp"
#include "lv.hpp"
#include "tlv.hpp"

namespace ccsdsio::cfdp {

enum class FilestoreActionCode : uint8_t {
    create_file = 0,
    delete_file = 1,
    rename_file = 2,
    append_file = 3,
    replace_file = 4,
    create_directory = 5,
    remove_directory = 6,
    deny_file = 7,
    deny_directory = 8,
};

// Rename, append and replace name a second file
constexpr bool has_second_file_name(FilestoreActionCode action) noexcept {
    return action == FilestoreActionCode::rename_file ||
           action == FilestoreActionCode::append_file ||
           action == FilestoreActionCode::replace_file;
}

// Filestore response status common to every action code
inline constexpr uint8_t filestore_status_successful = 0b0000;
inline constexpr uint8_t filestore_status_not_performed = 0b1111;

namespace detail {

inline Result<FilestoreActionCode> decode_action_code(uint8_t nibble) noexcept {
    if (nibble > static_cast<uint8_t>(FilestoreActionCode::deny_directory)) {
        return ValidationError::invalid_field_value;
    }
    return static_cast<FilestoreActionCode>(nibble);
}

} // namespace detail

/**
 * @brief Entity ID TLV (type 06h), used as the fault location
 */
struct EntityIdTlv {
    uint64_t entity_id = 0;
    uint8_t width = 1; // 1..8 bytes on the wire

    Result<Tlv> to_tlv() const {
        if (width < 1 || width > 8) {
            return ValidationError::invalid_length_field;
        }
        if (!ccsdsio::detail::fits_in_bytes(entity_id, width)) {
            return ValidationError::value_too_large;
        }
        std::vector<uint8_t> value(width);
        ccsdsio::detail::write_uint(value.data(), 0, width, entity_id);
        return Tlv(TlvType::entity_id, std::move(value));
    }

    static Result<EntityIdTlv> from_tlv(const Tlv& tlv) {
        if (!tlv.is(TlvType::entity_id)) {
            return ValidationError::tlv_type_mismatch;
        }
        if (tlv.value.empty() || tlv.value.size() > 8) {
            return ValidationError::invalid_length_field;
        }
        EntityIdTlv out;
        out.width = static_cast<uint8_t>(tlv.value.size());
        out.entity_id = ccsdsio::detail::read_uint(tlv.value.data(), 0, out.width);
        return out;
    }

    bool operator==(const EntityIdTlv&) const = default;
};

/**
 * @brief Filestore request TLV (type 00h)
 *
 * action(4) | spare(4), first file name LV, second file name LV
 * (rename, append and replace only)
 */
struct FilestoreRequestTlv {
    FilestoreActionCode action = FilestoreActionCode::create_file;
    std::string first_file_name;
    std::string second_file_name;

    Result<Tlv> to_tlv() const {
        if (!detail::fits_in_bits(action, 4)) {
            return ValidationError::value_too_large;
        }
        std::vector<uint8_t> value;
        ccsdsio::detail::ByteWriter writer(value);
        writer.put_u8(static_cast<uint8_t>(static_cast<uint8_t>(action) << 4));
        if (auto err = put_lv(writer, first_file_name); err != ValidationError::none) {
            return err;
        }
        if (has_second_file_name(action)) {
            if (auto err = put_lv(writer, second_file_name); err != ValidationError::none) {
                return err;
            }
        }
        if (value.size() > max_lv_value_length) {
            return ValidationError::value_too_large;
        }
        return Tlv(TlvType::filestore_request, std::move(value));
    }

    static Result<FilestoreRequestTlv> from_tlv(const Tlv& tlv) {
        if (!tlv.is(TlvType::filestore_request)) {
            return ValidationError::tlv_type_mismatch;
        }
        ccsdsio::detail::ByteReader reader(tlv.value);
        uint8_t first = 0;
        if (!reader.read_u8(first)) {
            return ValidationError::buffer_underflow;
        }
        auto action = detail::decode_action_code(static_cast<uint8_t>(first >> 4));
        if (!action.ok()) {
            return action.error();
        }
        FilestoreRequestTlv out;
        out.action = *action;
        if (auto err = read_lv(reader, out.first_file_name); err != ValidationError::none) {
            return err;
        }
        if (has_second_file_name(out.action)) {
            if (auto err = read_lv(reader, out.second_file_name); err != ValidationError::none) {
                return err;
            }
        }
        if (!reader.empty()) {
            return ValidationError::trailing_data;
        }
        return out;
    }

    bool operator==(const FilestoreRequestTlv&) const = default;
};

/**
 * @brief Filestore response TLV (type 01h)
 *
 * action(4) | status(4), first file name LV, second file name LV
 * (rename, append and replace only), filestore message LV
 */
struct FilestoreResponseTlv {
    FilestoreActionCode action = FilestoreActionCode::create_file;
    uint8_t status_code = filestore_status_successful;
    std::string first_file_name;
    std::string second_file_name;
    std::string filestore_message;

    Result<Tlv> to_tlv() const {
        if (status_code > 0x0F || !detail::fits_in_bits(action, 4)) {
            return ValidationError::value_too_large;
        }
        std::vector<uint8_t> value;
        ccsdsio::detail::ByteWriter writer(value);
        writer.put_u8(static_cast<uint8_t>((static_cast<uint8_t>(action) << 4) | status_code));
        if (auto err = put_lv(writer, first_file_name); err != ValidationError::none) {
            return err;
        }
        if (has_second_file_name(action)) {
            if (auto err = put_lv(writer, second_file_name); err != ValidationError::none) {
                return err;
            }
        }
        if (auto err = put_lv(writer, filestore_message); err != ValidationError::none) {
            return err;
        }
        if (value.size() > max_lv_value_length) {
            return ValidationError::value_too_large;
        }
        return Tlv(TlvType::filestore_response, std::move(value));
    }

    static Result<FilestoreResponseTlv> from_tlv(const Tlv& tlv) {
        if (!tlv.is(TlvType::filestore_response)) {
            return ValidationError::tlv_type_mismatch;
        }
        ccsdsio::detail::ByteReader reader(tlv.value);
        uint8_t first = 0;
        if (!reader.read_u8(first)) {
            return ValidationError::buffer_underflow;
        }
        auto action = detail::decode_action_code(static_cast<uint8_t>(first >> 4));
        if (!action.ok()) {
            return action.error();
        }
        FilestoreResponseTlv out;
        out.action = *action;
        out.status_code = static_cast<uint8_t>(first & 0x0F);
        if (auto err = read_lv(reader, out.first_file_name); err != ValidationError::none) {
            return err;
        }
        if (has_second_file_name(out.action)) {
            if (auto err = read_lv(reader, out.second_file_name); err != ValidationError::none) {
                return err;
            }
        }
        if (auto err = read_lv(reader, out.filestore_message); err != ValidationError::none) {
            return err;
        }
        if (!reader.empty()) {
            return ValidationError::trailing_data;
        }
        return out;
    }

    bool operator==(const FilestoreResponseTlv&) const = default;
};

// Marker opening messages reserved for CFDP proxy and directory operations
inline constexpr std::array<uint8_t, 4> reserved_message_marker = {'c', 'f', 'd', 'p'};

/**
 * @brief Message to user TLV (type 02h)
 */
struct MessageToUserTlv {
    std::vector<uint8_t> message;

    // True for messages carrying the "cfdp" marker followed by a message type
    bool is_reserved_cfdp_message() const noexcept {
        return message.size() > reserved_message_marker.size() &&
               std::equal(reserved_message_marker.begin(), reserved_message_marker.end(),
                          message.begin());
    }

    // Message type octet following the marker
    Result<uint8_t> reserved_message_type() const noexcept {
        if (!is_reserved_cfdp_message()) {
            return ValidationError::invalid_field_value;
        }
        return message[reserved_message_marker.size()];
    }

    Result<Tlv> to_tlv() const {
        if (message.size() > max_lv_value_length) {
            return ValidationError::value_too_large;
        }
        return Tlv(TlvType::message_to_user, message);
    }

    static Result<MessageToUserTlv> from_tlv(const Tlv& tlv) {
        if (!tlv.is(TlvType::message_to_user)) {
            return ValidationError::tlv_type_mismatch;
        }
        return MessageToUserTlv{tlv.value};
    }

    bool operator==(const MessageToUserTlv&) const = default;
};

/**
 * @brief Fault handler override TLV (type 04h)
 *
 * condition code(4) | handler code(4)
 */
struct FaultHandlerOverrideTlv {
    ConditionCode condition = ConditionCode::no_error;
    FaultHandlerCode handler = FaultHandlerCode::ignore_error;

    Result<Tlv> to_tlv() const {
        if (static_cast<uint8_t>(condition) > 0x0F || static_cast<uint8_t>(handler) > 0x0F) {
            return ValidationError::value_too_large;
        }
        return Tlv(TlvType::fault_handler_override,
                   {static_cast<uint8_t>((static_cast<uint8_t>(condition) << 4) |
                                         static_cast<uint8_t>(handler))});
    }

    static Result<FaultHandlerOverrideTlv> from_tlv(const Tlv& tlv) {
        if (!tlv.is(TlvType::fault_handler_override)) {
            return ValidationError::tlv_type_mismatch;
        }
        if (tlv.value.size() != 1) {
            return ValidationError::invalid_field_value;
        }
        uint8_t handler = tlv.value[0] & 0x0F;
        if (handler < static_cast<uint8_t>(FaultHandlerCode::notice_of_cancellation) ||
            handler > static_cast<uint8_t>(FaultHandlerCode::abandon_transaction)) {
            return ValidationError::invalid_field_value;
        }
        FaultHandlerOverrideTlv out;
        out.condition = static_cast<ConditionCode>(tlv.value[0] >> 4);
        out.handler = static_cast<FaultHandlerCode>(handler);
        return out;
    }

    bool operator==(const FaultHandlerOverrideTlv&) const = default;
};

/**
 * @brief Flow label TLV (type 05h); contents are implementation specific
 */
struct FlowLabelTlv {
    std::vector<uint8_t> label;

    Result<Tlv> to_tlv() const {
        if (label.size() > max_lv_value_length) {
            return ValidationError::value_too_large;
        }
        return Tlv(TlvType::flow_label, label);
    }

    static Result<FlowLabelTlv> from_tlv(const Tlv& tlv) {
        if (!tlv.is(TlvType::flow_label)) {
            return ValidationError::tlv_type_mismatch;
        }
        return FlowLabelTlv{tlv.value};
    }

    bool operator==(const FlowLabelTlv&) const = default;
};

} // namespace ccsdsio::cfdp
