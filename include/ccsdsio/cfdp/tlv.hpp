#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "../core/detail/byte_stream.hpp"
#include "../core/result.hpp"
#include "../core/types.hpp"
#include "lv.hpp"

namespace ccsdsio::cfdp {

enum class TlvType : uint8_t {
    filestore_request = 0x00,
    filestore_response = 0x01,
    message_to_user = 0x02,
    fault_handler_override = 0x04,
    flow_label = 0x05,
    entity_id = 0x06,
};

constexpr bool is_known_tlv_type(uint8_t type) noexcept {
    switch (static_cast<TlvType>(type)) {
        case TlvType::filestore_request:
        case TlvType::filestore_response:
        case TlvType::message_to_user:
        case TlvType::fault_handler_override:
        case TlvType::flow_label:
        case TlvType::entity_id:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Raw type-length-value parameter
 *
 * The type is kept as a plain octet so unrecognized types survive a
 * decode/encode cycle unchanged. The length is always derived from value.
 */
struct Tlv {
    uint8_t type = 0;
    std::vector<uint8_t> value;

    Tlv() = default;

    Tlv(uint8_t raw_type, std::vector<uint8_t> bytes) : type(raw_type), value(std::move(bytes)) {}

    Tlv(TlvType tlv_type, std::vector<uint8_t> bytes)
        : type(static_cast<uint8_t>(tlv_type)), value(std::move(bytes)) {}

    bool is(TlvType t) const noexcept { return type == static_cast<uint8_t>(t); }

    bool known() const noexcept { return is_known_tlv_type(type); }

    // Type octet, length octet and value
    size_t encoded_length() const noexcept { return 2 + value.size(); }

    bool operator==(const Tlv&) const = default;
};

/**
 * @brief Append an encoded TLV
 * @return none, or value_too_large for values longer than 255 bytes
 */
inline ValidationError put_tlv(ccsdsio::detail::ByteWriter& writer, const Tlv& tlv) {
    if (tlv.value.size() > max_lv_value_length) {
        return ValidationError::value_too_large;
    }
    writer.put_u8(tlv.type);
    writer.put_u8(static_cast<uint8_t>(tlv.value.size()));
    writer.put_bytes(tlv.value);
    return ValidationError::none;
}

/**
 * @brief Read one TLV
 * @return none, or buffer_underflow when the value is shorter than declared
 */
inline ValidationError read_tlv(ccsdsio::detail::ByteReader& reader, Tlv& tlv) {
    uint8_t type = 0;
    std::span<const uint8_t> value;
    if (!reader.read_u8(type)) {
        return ValidationError::buffer_underflow;
    }
    if (auto err = read_lv(reader, value); err != ValidationError::none) {
        return err;
    }
    tlv.type = type;
    tlv.value.assign(value.begin(), value.end());
    return ValidationError::none;
}

inline Result<std::vector<uint8_t>> encode_tlv(const Tlv& tlv) {
    std::vector<uint8_t> out;
    ccsdsio::detail::ByteWriter writer(out);
    if (auto err = put_tlv(writer, tlv); err != ValidationError::none) {
        return err;
    }
    return out;
}

// Decode one TLV from the front of bytes; trailing bytes are ignored
inline Result<Tlv> decode_tlv(std::span<const uint8_t> bytes) {
    ccsdsio::detail::ByteReader reader(bytes);
    Tlv tlv;
    if (auto err = read_tlv(reader, tlv); err != ValidationError::none) {
        return err;
    }
    return tlv;
}

inline ValidationError put_tlv_list(ccsdsio::detail::ByteWriter& writer,
                                    const std::vector<Tlv>& tlvs) {
    for (const auto& tlv : tlvs) {
        if (auto err = put_tlv(writer, tlv); err != ValidationError::none) {
            return err;
        }
    }
    return ValidationError::none;
}

/**
 * @brief Read TLVs until the reader is exhausted
 *
 * A single leftover byte cannot hold a type and a length and is reported as
 * trailing_data. A TLV whose value runs past the end is buffer_underflow.
 */
inline ValidationError read_tlv_list(ccsdsio::detail::ByteReader& reader, std::vector<Tlv>& tlvs) {
    while (!reader.empty()) {
        if (reader.remaining() == 1) {
            return ValidationError::trailing_data;
        }
        Tlv tlv;
        if (auto err = read_tlv(reader, tlv); err != ValidationError::none) {
            return err;
        }
        tlvs.push_back(std::move(tlv));
    }
    return ValidationError::none;
}

inline Result<std::vector<uint8_t>> encode_tlv_list(const std::vector<Tlv>& tlvs) {
    std::vector<uint8_t> out;
    ccsdsio::detail::ByteWriter writer(out);
    if (auto err = put_tlv_list(writer, tlvs); err != ValidationError::none) {
        return err;
    }
    return out;
}

inline Result<std::vector<Tlv>> decode_tlv_list(std::span<const uint8_t> bytes) {
    ccsdsio::detail::ByteReader reader(bytes);
    std::vector<Tlv> tlvs;
    if (auto err = read_tlv_list(reader, tlvs); err != ValidationError::none) {
        return err;
    }
    return tlvs;
}

} // namespace ccsdsio::cfdp
