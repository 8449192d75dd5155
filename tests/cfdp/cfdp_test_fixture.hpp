#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include <ccsdsio/cfdp/pdu_codec.hpp>
#include <ccsdsio/core/diagnostics.hpp>
#include <gtest/gtest.h>

// Codec with 1-byte entity ids and sequence numbers so expected bytes stay short
class CfdpPduTest : public ::testing::Test {
protected:
    static ccsdsio::cfdp::CfdpConfig narrow_config() {
        ccsdsio::cfdp::CfdpConfig config;
        config.default_entity_id_width = 1;
        config.default_sequence_number_width = 1;
        return config;
    }

    ccsdsio::cfdp::PduHeader directive_header() const {
        return codec_.make_header(ccsdsio::cfdp::PduType::file_directive, 0, 0, 0);
    }

    ccsdsio::cfdp::PduHeader file_data_header() const {
        return codec_.make_header(ccsdsio::cfdp::PduType::file_data, 0, 0, 0);
    }

    // Fixed header for 1-byte fields and zero ids followed by the data field
    static std::vector<uint8_t> with_header(uint8_t first_octet,
                                            std::initializer_list<uint8_t> data_field) {
        std::vector<uint8_t> out{first_octet, 0x00, static_cast<uint8_t>(data_field.size()),
                                 0x00, 0x00, 0x00, 0x00};
        out.insert(out.end(), data_field.begin(), data_field.end());
        return out;
    }

    ccsdsio::cfdp::PduCodec codec_{narrow_config()};
};

// Records every report for later inspection
class RecordingSink : public ccsdsio::DiagnosticSink {
public:
    struct Entry {
        ccsdsio::Severity severity;
        ccsdsio::ValidationError error;
        std::string message;
    };

    void report(ccsdsio::Severity severity, ccsdsio::ValidationError error,
                std::string_view message) noexcept override {
        entries.push_back({severity, error, std::string(message)});
    }

    std::vector<Entry> entries;
};
