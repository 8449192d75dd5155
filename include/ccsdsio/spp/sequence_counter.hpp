#pragma once

#include <cstdint>

#include "../core/types.hpp"

namespace ccsdsio {

/**
 * @brief 14-bit packet sequence count source
 *
 * Owned by the producing application, one per APID. Not internally
 * synchronized; share across threads only under external locking.
 */
class SequenceCounter {
public:
    constexpr SequenceCounter() noexcept = default;

    // Returns the current value, then advances modulo 16384
    constexpr uint16_t next() noexcept {
        uint16_t current = value_;
        value_ = static_cast<uint16_t>((value_ + 1) % sequence_count_modulus);
        return current;
    }

    constexpr uint16_t peek() const noexcept { return value_; }

    // Value is left unchanged on error
    constexpr ValidationError reset(uint16_t to = 0) noexcept {
        if (to > max_sequence_count) {
            return ValidationError::value_too_large;
        }
        value_ = to;
        return ValidationError::none;
    }

private:
    uint16_t value_ = 0;
};

} // namespace ccsdsio
