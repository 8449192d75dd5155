#pragma once

#include <optional>
#include <string>
#include <utility>

#include "types.hpp"

namespace ccsdsio {

/**
 * @brief Outcome of a decode or encode operation
 *
 * Holds the produced value, the validation error, or both. Structural
 * failures carry no value. Advisory failures (see is_advisory()) keep the
 * decoded value so callers can inspect a PDU whose CRC did not match.
 */
template <typename T>
class Result {
public:
    constexpr Result(T value) : value_(std::move(value)) {}

    constexpr Result(ValidationError error) : error_(error) {}

    constexpr Result(T value, ValidationError error) : value_(std::move(value)), error_(error) {}

    bool ok() const noexcept { return error_ == ValidationError::none && value_.has_value(); }

    explicit operator bool() const noexcept { return ok(); }

    bool has_value() const noexcept { return value_.has_value(); }

    ValidationError error() const noexcept { return error_; }

    std::string error_message() const { return validation_error_string(error_); }

    // Precondition: has_value()
    T& value() & { return *value_; }
    const T& value() const& { return *value_; }
    T&& value() && { return std::move(*value_); }

    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }

    T& operator*() & { return *value_; }
    const T& operator*() const& { return *value_; }

    T value_or(T fallback) const& { return value_.has_value() ? *value_ : std::move(fallback); }

private:
    std::optional<T> value_;
    ValidationError error_ = ValidationError::none;
};

} // namespace ccsdsio
