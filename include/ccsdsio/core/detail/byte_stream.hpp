#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "buffer_io.hpp"

namespace ccsdsio::detail {

/**
 * @brief Bounds-checked sequential reader over a byte span
 *
 * Every read checks the remaining length first and leaves the position
 * untouched on failure, so a decoder can bail out with buffer_underflow
 * without reading past the caller's buffer.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    size_t position() const noexcept { return pos_; }
    size_t remaining() const noexcept { return data_.size() - pos_; }
    bool empty() const noexcept { return pos_ >= data_.size(); }

    bool read_u8(uint8_t& out) noexcept {
        if (remaining() < 1) {
            return false;
        }
        out = data_[pos_++];
        return true;
    }

    bool read_u16(uint16_t& out) noexcept {
        if (remaining() < 2) {
            return false;
        }
        out = read_u16_at(pos_);
        pos_ += 2;
        return true;
    }

    bool read_u32(uint32_t& out) noexcept {
        if (remaining() < 4) {
            return false;
        }
        out = detail::read_u32(data_.data(), pos_);
        pos_ += 4;
        return true;
    }

    // Big-endian unsigned integer of 1..8 bytes
    bool read_uint(size_t width, uint64_t& out) noexcept {
        if (width == 0 || width > 8 || remaining() < width) {
            return false;
        }
        out = detail::read_uint(data_.data(), pos_, width);
        pos_ += width;
        return true;
    }

    bool read_bytes(size_t count, std::span<const uint8_t>& out) noexcept {
        if (remaining() < count) {
            return false;
        }
        out = data_.subspan(pos_, count);
        pos_ += count;
        return true;
    }

    // Everything not yet consumed; does not advance
    std::span<const uint8_t> rest() const noexcept { return data_.subspan(pos_); }

private:
    uint16_t read_u16_at(size_t offset) const noexcept {
        return detail::read_u16(data_.data(), offset);
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

/**
 * @brief Appending big-endian writer over a byte vector
 */
class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& out) noexcept : out_(out) {}

    size_t size() const noexcept { return out_.size(); }

    void put_u8(uint8_t value) { out_.push_back(value); }

    void put_u16(uint16_t value) { put_uint(2, value); }

    void put_u32(uint32_t value) { put_uint(4, value); }

    // Low (8 * width) bits of value, most significant byte first
    void put_uint(size_t width, uint64_t value) {
        size_t offset = out_.size();
        out_.resize(offset + width);
        detail::write_uint(out_.data(), offset, width, value);
    }

    void put_bytes(std::span<const uint8_t> bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    // Overwrite a previously written 16-bit field
    void patch_u16(size_t offset, uint16_t value) noexcept {
        detail::write_u16(out_.data(), offset, value);
    }

private:
    std::vector<uint8_t>& out_;
};

} // namespace ccsdsio::detail
