#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ccsdsio::cfdp {

/**
 * @brief CFDP modular file checksum (checksum type 0)
 *
 * The file is treated as a sequence of 32-bit big-endian words aligned on
 * file offsets that are multiples of 4, and the words are summed modulo 2^32.
 * A segment is positioned by its file offset, so segments may be added in any
 * order and the result matches a single pass over the whole file.
 */
class ModularChecksum {
public:
    constexpr ModularChecksum() noexcept = default;

    constexpr explicit ModularChecksum(uint32_t initial) noexcept : value_(initial) {}

    constexpr void update(std::span<const uint8_t> data, uint64_t offset) noexcept {
        for (size_t i = 0; i < data.size(); ++i) {
            auto shift = static_cast<uint32_t>(24 - 8 * ((offset + i) % 4));
            value_ += static_cast<uint32_t>(data[i]) << shift;
        }
    }

    constexpr uint32_t value() const noexcept { return value_; }

private:
    uint32_t value_ = 0;
};

// Modular checksum of a complete file held in memory
constexpr uint32_t modular_checksum(std::span<const uint8_t> file) noexcept {
    ModularChecksum checksum;
    checksum.update(file, 0);
    return checksum.value();
}

} // namespace ccsdsio::cfdp
