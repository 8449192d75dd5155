// CFDP PDU example: encode a class 1 transfer and decode it with diagnostics

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <ccsdsio.hpp>

using namespace ccsdsio;
using namespace ccsdsio::cfdp;

namespace {

const char* directive_name(const Pdu& pdu) {
    if (pdu.is_file_data()) {
        return "File Data";
    }
    switch (static_cast<DirectiveCode>(*pdu.directive_code())) {
        case DirectiveCode::eof:
            return "EOF";
        case DirectiveCode::finished:
            return "Finished";
        case DirectiveCode::ack:
            return "ACK";
        case DirectiveCode::metadata:
            return "Metadata";
        case DirectiveCode::nak:
            return "NAK";
        case DirectiveCode::prompt:
            return "Prompt";
        case DirectiveCode::keep_alive:
            return "Keep Alive";
    }
    return "Unknown";
}

} // namespace

int main() {
    std::cout << "CCSDSIO CFDP Example\n";
    std::cout << "====================\n\n";

    // Advisory conditions (CRC mismatch, unknown directives) go to stderr
    OstreamDiagnosticSink sink(std::cerr);

    CfdpConfig config;
    config.crc_algorithm = CrcAlgorithm::crc32;
    config.sink = &sink;
    PduCodec codec(config);

    const std::string text = "The quick brown fox jumps over the lazy dog";
    std::vector<uint8_t> file(text.begin(), text.end());
    constexpr size_t segment_size = 16;

    auto header = codec.make_header(PduType::file_directive, 10, 1, 20);
    header.transmission_mode = TransmissionMode::unacknowledged;
    header.crc_flag = true;
    auto data_header = header;
    data_header.pdu_type = PduType::file_data;

    std::vector<Pdu> pdus;
    MetadataPdu metadata;
    metadata.file_size = file.size();
    metadata.source_file_name = "fox.txt";
    metadata.destination_file_name = "downlink/fox.txt";
    pdus.push_back(Pdu{header, metadata});

    for (size_t offset = 0; offset < file.size(); offset += segment_size) {
        auto segment = std::span<const uint8_t>(file).subspan(offset);
        FileDataPdu file_data;
        file_data.offset = offset;
        file_data.data.assign(segment.begin(),
                              segment.begin() + std::min(segment_size, segment.size()));
        pdus.push_back(Pdu{data_header, file_data});
    }

    EofPdu eof;
    eof.file_size = file.size();
    eof.checksum = modular_checksum(file);
    pdus.push_back(Pdu{header, eof});

    // Example 1: Encode every PDU of the transaction
    std::cout << "1. Sender\n";
    std::vector<std::vector<uint8_t>> wire;
    for (const auto& pdu : pdus) {
        auto bytes = codec.encode(pdu);
        if (!bytes) {
            std::cerr << "Encoding failed: " << validation_error_string(bytes.error()) << "\n";
            return 1;
        }
        std::cout << "  " << directive_name(pdu) << ": " << bytes->size() << " bytes\n";
        wire.push_back(std::move(*bytes));
    }

    // Example 2: Decode, reassemble and verify the checksum
    std::cout << "\n2. Receiver\n";
    std::vector<uint8_t> received(file.size());
    ModularChecksum checksum;
    for (const auto& bytes : wire) {
        auto pdu = codec.decode(bytes);
        if (!pdu) {
            std::cerr << "Decoding failed: " << validation_error_string(pdu.error()) << "\n";
            return 1;
        }
        if (const auto* fd = pdu->get_if<FileDataPdu>()) {
            std::copy(fd->data.begin(), fd->data.end(),
                      received.begin() + static_cast<std::ptrdiff_t>(fd->offset));
            checksum.update(fd->data, fd->offset);
        } else if (const auto* end = pdu->get_if<EofPdu>()) {
            std::cout << "  EOF checksum " << (end->checksum == checksum.value() ? "OK" : "BAD")
                      << "\n";
        }
    }
    std::cout << "  Received: " << std::string(received.begin(), received.end()) << "\n";

    // Example 3: A corrupted PDU still decodes, with the mismatch reported
    std::cout << "\n3. Corrupted PDU\n";
    auto corrupted = wire[1];
    corrupted[header.header_length() + 8] ^= 0x20;
    auto damaged = codec.decode(corrupted);
    if (damaged.has_value()) {
        const auto* fd = damaged->get_if<FileDataPdu>();
        std::cout << "  Result: " << validation_error_string(damaged.error()) << "\n";
        std::cout << "  Data: " << std::string(fd->data.begin(), fd->data.end()) << "\n";
    }

    return 0;
}
