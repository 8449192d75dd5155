#pragma once

#include <chrono>
#include <compare>
#include <cstdint>

#include "../core/result.hpp"
#include "../core/types.hpp"

namespace ccsdsio {

/**
 * @brief Reference instant of an epoch-relative time code
 *
 * Stored as the signed number of seconds from 1970-01-01T00:00:00 to the
 * epoch. The epoch is never transmitted; both ends agree on it out of band.
 * Conversions apply a plain offset and do not insert leap seconds.
 */
struct Epoch {
    int64_t seconds_from_unix = 0;

    // 1958-01-01T00:00:00, CCSDS recommended epoch (level 1 CUC, CDS epoch bit 0)
    static constexpr Epoch ccsds_1958() noexcept { return Epoch{-378'691'200}; }

    static constexpr Epoch unix_1970() noexcept { return Epoch{0}; }

    static Epoch from_time_point(std::chrono::system_clock::time_point tp) noexcept {
        auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
        return Epoch{static_cast<int64_t>(secs.count())};
    }

    std::chrono::system_clock::time_point to_time_point() const noexcept {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(seconds_from_unix)));
    }

    constexpr auto operator<=>(const Epoch&) const noexcept = default;
};

namespace detail {

inline constexpr uint64_t nanoseconds_per_second = 1'000'000'000ULL;
inline constexpr uint64_t milliseconds_per_day = 86'400'000ULL;
inline constexpr uint64_t seconds_per_day = 86'400ULL;

// Nanoseconds elapsed since epoch; negative when tp precedes it
inline int64_t nanoseconds_since(const Epoch& epoch,
                                 std::chrono::system_clock::time_point tp) noexcept {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    return ns - epoch.seconds_from_unix * static_cast<int64_t>(nanoseconds_per_second);
}

inline std::chrono::system_clock::time_point time_point_at(const Epoch& epoch,
                                                           std::chrono::nanoseconds elapsed) noexcept {
    return epoch.to_time_point() +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

// time_point_at for durations that may run past the end of system_clock
inline Result<std::chrono::system_clock::time_point>
checked_time_point_at(const Epoch& epoch, std::chrono::nanoseconds elapsed) noexcept {
    using duration = std::chrono::system_clock::duration;
    auto offset = epoch.to_time_point().time_since_epoch();
    auto span = std::chrono::duration_cast<duration>(elapsed);
    if (offset > duration::zero() && span > duration::max() - offset) {
        return ValidationError::value_out_of_range;
    }
    return epoch.to_time_point() + span;
}

} // namespace detail

} // namespace ccsdsio
