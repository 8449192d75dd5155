// CCSDS time code examples

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <ccsdsio.hpp>

using namespace ccsdsio;

// Helper function to print an encoded time code
void print_time_code(const std::vector<uint8_t>& bytes, std::chrono::system_clock::time_point tp,
                     const std::string& label) {
    std::cout << label << ":\n";
    std::cout << "  Bytes:";
    for (auto b : bytes) {
        std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    std::cout << std::dec << std::setfill(' ') << "\n";

    // Convert to human-readable time
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm* tm_info = std::gmtime(&time);
    std::cout << "  UTC time: " << std::put_time(tm_info, "%Y-%m-%d %H:%M:%S");

    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch() % std::chrono::seconds(1))
                      .count();
    std::cout << "." << std::setfill('0') << std::setw(6) << micros << std::setfill(' ')
              << " UTC\n\n";
}

int main() {
    std::cout << "CCSDSIO Time Code Examples\n";
    std::cout << "==========================\n\n";

    auto now = std::chrono::system_clock::now();

    // Example 1: CUC with the CCSDS epoch
    std::cout << "1. Unsegmented time code\n";
    std::cout << "------------------------\n";

    auto cuc = make_cuc(now, CucFormat{}, Epoch::ccsds_1958());
    if (!cuc) {
        std::cerr << "CUC failed: " << validation_error_string(cuc.error()) << "\n";
        return 1;
    }
    auto cuc_bytes = encode_cuc(*cuc);
    if (!cuc_bytes) {
        return 1;
    }
    print_time_code(*cuc_bytes, cuc->to_time_point(Epoch::ccsds_1958()), "CUC 4+2, 1958 epoch");

    // Example 2: CUC with an agency epoch (here the Unix epoch)
    CucFormat agency{.coarse_bytes = 4, .fine_bytes = 1, .agency_epoch = true};
    auto unix_cuc = make_cuc(now, agency, Epoch::unix_1970());
    if (unix_cuc) {
        if (auto bytes = encode_cuc(*unix_cuc); bytes) {
            print_time_code(*bytes, unix_cuc->to_time_point(Epoch::unix_1970()),
                            "CUC 4+1, agency epoch");
        }
    }

    // Example 3: Day segmented codes at each resolution
    std::cout << "2. Day segmented time code\n";
    std::cout << "--------------------------\n";

    for (auto resolution :
         {CdsResolution::milliseconds, CdsResolution::microseconds, CdsResolution::picoseconds}) {
        CdsFormat format;
        format.resolution = resolution;
        auto cds = make_cds(now, format, Epoch::ccsds_1958());
        if (!cds) {
            std::cerr << "CDS failed: " << validation_error_string(cds.error()) << "\n";
            return 1;
        }
        auto bytes = encode_cds(*cds);
        if (!bytes) {
            return 1;
        }
        auto tp = cds->to_time_point(Epoch::ccsds_1958());
        if (!tp) {
            return 1;
        }
        print_time_code(*bytes, *tp, "CDS day " + std::to_string(cds->day));
    }

    // Example 4: Decoding a received code
    std::cout << "3. Decoding\n";
    std::cout << "-----------\n";

    std::vector<uint8_t> received{0x40, 0x5E, 0x2A, 0x00, 0x00, 0x00, 0x00};
    auto decoded = decode_cds(received);
    if (!decoded) {
        std::cerr << "Decode failed: " << validation_error_string(decoded.error()) << "\n";
        return 1;
    }
    auto when = decoded->to_time_point(Epoch::ccsds_1958());
    if (!when) {
        std::cerr << "Conversion failed: " << validation_error_string(when.error()) << "\n";
        return 1;
    }
    print_time_code(received, *when, "Received CDS");

    return 0;
}
