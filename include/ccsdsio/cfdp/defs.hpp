#pragma once

#include <cstddef>
#include <cstdint>

namespace ccsdsio::cfdp {

// CFDP protocol version carried in the PDU header (CCSDS 727.0-B-5)
inline constexpr uint8_t protocol_version = 0b001;

// Fixed part of the PDU header before the entity ids
inline constexpr size_t fixed_header_bytes = 4;

enum class PduType : uint8_t {
    file_directive = 0,
    file_data = 1,
};

enum class Direction : uint8_t {
    toward_receiver = 0,
    toward_sender = 1,
};

enum class TransmissionMode : uint8_t {
    acknowledged = 0,
    unacknowledged = 1,
};

enum class SegmentationControl : uint8_t {
    boundaries_not_preserved = 0,
    boundaries_preserved = 1,
};

enum class DirectiveCode : uint8_t {
    eof = 0x04,
    finished = 0x05,
    ack = 0x06,
    metadata = 0x07,
    nak = 0x08,
    prompt = 0x09,
    keep_alive = 0x0C,
};

constexpr bool is_known_directive(uint8_t code) noexcept {
    switch (static_cast<DirectiveCode>(code)) {
        case DirectiveCode::eof:
        case DirectiveCode::finished:
        case DirectiveCode::ack:
        case DirectiveCode::metadata:
        case DirectiveCode::nak:
        case DirectiveCode::prompt:
        case DirectiveCode::keep_alive:
            return true;
        default:
            return false;
    }
}

enum class ConditionCode : uint8_t {
    no_error = 0,
    positive_ack_limit_reached = 1,
    keep_alive_limit_reached = 2,
    invalid_transmission_mode = 3,
    filestore_rejection = 4,
    file_checksum_failure = 5,
    file_size_error = 6,
    nak_limit_reached = 7,
    inactivity_detected = 8,
    invalid_file_structure = 9,
    check_limit_reached = 10,
    unsupported_checksum_type = 11,
    suspend_request_received = 14,
    cancel_request_received = 15,
};

constexpr const char* condition_code_string(ConditionCode cc) noexcept {
    switch (cc) {
        case ConditionCode::no_error:
            return "No error";
        case ConditionCode::positive_ack_limit_reached:
            return "Positive ACK limit reached";
        case ConditionCode::keep_alive_limit_reached:
            return "Keep alive limit reached";
        case ConditionCode::invalid_transmission_mode:
            return "Invalid transmission mode";
        case ConditionCode::filestore_rejection:
            return "Filestore rejection";
        case ConditionCode::file_checksum_failure:
            return "File checksum failure";
        case ConditionCode::file_size_error:
            return "File size error";
        case ConditionCode::nak_limit_reached:
            return "NAK limit reached";
        case ConditionCode::inactivity_detected:
            return "Inactivity detected";
        case ConditionCode::invalid_file_structure:
            return "Invalid file structure";
        case ConditionCode::check_limit_reached:
            return "Check limit reached";
        case ConditionCode::unsupported_checksum_type:
            return "Unsupported checksum type";
        case ConditionCode::suspend_request_received:
            return "Suspend request received";
        case ConditionCode::cancel_request_received:
            return "Cancel request received";
        default:
            return "Reserved condition code";
    }
}

// Finished PDU delivery code
enum class DeliveryCode : uint8_t {
    data_complete = 0,
    data_incomplete = 1,
};

// Finished PDU file status
enum class FileStatus : uint8_t {
    discarded_deliberately = 0b00,
    discarded_filestore_rejection = 0b01,
    retained = 0b10,
    unreported = 0b11,
};

// ACK PDU transaction status
enum class TransactionStatus : uint8_t {
    undefined = 0b00,
    active = 0b01,
    terminated = 0b10,
    unrecognized = 0b11,
};

// Checksum algorithm identifiers (SANA checksum type registry)
enum class ChecksumType : uint8_t {
    modular = 0,
    proximity1 = 1,
    crc32c = 2,
    crc32 = 3,
    null_checksum = 15,
};

// Prompt PDU response request
enum class PromptResponse : uint8_t {
    nak = 0,
    keep_alive = 1,
};

// File-Data PDU record continuation state (segment metadata present only)
enum class RecordContinuationState : uint8_t {
    neither_start_nor_end = 0b00,
    start = 0b01,
    end = 0b10,
    start_and_end = 0b11,
};

enum class FaultHandlerCode : uint8_t {
    notice_of_cancellation = 1,
    notice_of_suspension = 2,
    ignore_error = 3,
    abandon_transaction = 4,
};

// 4 bytes, or 8 bytes when the large file flag is set
constexpr size_t file_size_field_bytes(bool large_file) noexcept {
    return large_file ? 8 : 4;
}

namespace detail {

// Whether an enumerator fits its wire field of width bits
template <typename Enum>
constexpr bool fits_in_bits(Enum value, unsigned width) noexcept {
    return (static_cast<unsigned>(value) >> width) == 0;
}

} // namespace detail

} // namespace ccsdsio::cfdp
