// Basic usage example for CCSDSIO

#include <array>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <vector>

#include <ccsdsio.hpp>

namespace {

void print_hex(const std::vector<uint8_t>& bytes) {
    std::cout << std::hex << std::setfill('0');
    for (auto b : bytes) {
        std::cout << std::setw(2) << static_cast<int>(b) << ' ';
    }
    std::cout << std::dec << std::setfill(' ') << "\n";
}

} // namespace

int main() {
    std::cout << "CCSDSIO - Basic Usage Example\n";
    std::cout << "=============================\n\n";

    // Example 1: Encoding a space packet
    {
        std::cout << "Example 1: Encoding a space packet\n";

        ccsdsio::SequenceCounter counter;
        ccsdsio::SpacePacketHeader header;
        header.packet_type = ccsdsio::SpacePacketType::telecommand;
        header.apid = 0x023;

        std::array<uint8_t, 10> payload{};
        for (size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<uint8_t>(i);
        }

        auto packet = ccsdsio::encode_space_packet(header, payload, counter);
        if (!packet) {
            std::cerr << "  Encoding failed: "
                      << ccsdsio::validation_error_string(packet.error()) << "\n";
            return 1;
        }
        std::cout << "  Bytes: ";
        print_hex(*packet);
        std::cout << "  Next sequence count: " << counter.peek() << "\n\n";
    }

    // Example 2: Parsing received bytes (always check the result)
    {
        std::cout << "Example 2: Parsing a space packet\n";

        std::vector<uint8_t> received{0x18, 0x23, 0xC0, 0x2A, 0x00, 0x01, 0xAB, 0xCD};
        auto packet = ccsdsio::decode_space_packet(received);
        if (!packet) {
            std::cerr << "  Decoding failed: "
                      << ccsdsio::validation_error_string(packet.error()) << "\n";
            return 1;
        }
        std::cout << "  APID: 0x" << std::hex << packet->header.apid << std::dec << "\n";
        std::cout << "  Sequence count: " << packet->header.sequence_count << "\n";
        std::cout << "  Payload: " << packet->payload.size() << " bytes\n\n";
    }

    // Example 3: PUS ping and reply
    {
        std::cout << "Example 3: PUS service 17 ping\n";

        ccsdsio::SequenceCounter tc_counter;
        ccsdsio::SequenceCounter tm_counter;

        auto tc = ccsdsio::pus::encode_pus_tc(ccsdsio::pus::make_ping_tc(0x042), tc_counter);
        if (!tc) {
            return 1;
        }
        std::cout << "  TC[17,1]: ";
        print_hex(*tc);

        auto request = ccsdsio::pus::decode_pus_tc(*tc);
        if (!request) {
            std::cerr << "  Telecommand rejected: "
                      << ccsdsio::validation_error_string(request.error()) << "\n";
            return 1;
        }

        // CUC timestamp without P-field, as agreed for this mission
        ccsdsio::CucTimeCode stamp;
        stamp.coarse = 1000;
        auto t_field = ccsdsio::encode_cuc_t_field(stamp);
        if (!t_field) {
            return 1;
        }

        auto tm = ccsdsio::pus::encode_pus_tm(
            ccsdsio::pus::make_ping_reply(request->sp_header.apid, *t_field), tm_counter);
        if (!tm) {
            return 1;
        }
        std::cout << "  TM[17,2]: ";
        print_hex(*tm);

        auto service = ccsdsio::pus::pus_service(*tm);
        std::cout << "  Reply service: " << static_cast<int>(service.value_or(0)) << "\n\n";
    }

    // Example 4: USLP transfer frame primary header
    {
        std::cout << "Example 4: USLP primary header\n";

        ccsdsio::uslp::PrimaryHeader header;
        header.scid = 0x1234;
        header.vcid = 3;
        header.frame_length = 1023;
        header.vcf_count_length = 2;
        header.vcf_count = 0x0100;

        auto bytes = ccsdsio::uslp::encode_primary_header(header);
        if (!bytes) {
            return 1;
        }
        std::cout << "  Header: ";
        print_hex(*bytes);
    }

    return 0;
}
