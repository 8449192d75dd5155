#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include "types.hpp"

namespace ccsdsio {

enum class Severity : uint8_t {
    info = 0,
    warning = 1,
    error = 2,
};

constexpr const char* severity_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::info:
            return "info";
        case Severity::warning:
            return "warning";
        case Severity::error:
            return "error";
        default:
            return "unknown";
    }
}

/**
 * @brief Receiver for advisory conditions found while decoding
 *
 * Codecs never log through global state. Conditions that do not abort a
 * decode (CRC mismatch, nonzero spare bits under a lenient policy, unknown
 * directive codes) are reported to the sink carried in the codec
 * configuration. The sink is called synchronously from the decoding thread.
 */
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void report(Severity severity, ValidationError error,
                        std::string_view message) noexcept = 0;
};

// Discards every report
class NullDiagnosticSink final : public DiagnosticSink {
public:
    void report(Severity, ValidationError, std::string_view) noexcept override {}
};

/**
 * @brief Writes one line per report to an output stream
 *
 * Line format: "[severity] error text: message". The stream must outlive the
 * sink.
 */
class OstreamDiagnosticSink final : public DiagnosticSink {
public:
    explicit OstreamDiagnosticSink(std::ostream& os) noexcept : os_(os) {}

    void report(Severity severity, ValidationError error,
                std::string_view message) noexcept override {
        os_ << '[' << severity_string(severity) << "] " << validation_error_string(error);
        if (!message.empty()) {
            os_ << ": " << message;
        }
        os_ << '\n';
    }

private:
    std::ostream& os_;
};

namespace detail {

inline void report(DiagnosticSink* sink, Severity severity, ValidationError error,
                   std::string_view message) noexcept {
    if (sink != nullptr) {
        sink->report(severity, error, message);
    }
}

} // namespace detail

} // namespace ccsdsio
