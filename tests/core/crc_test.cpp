#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include <ccsdsio/core/crc.hpp>
#include <gtest/gtest.h>

using namespace ccsdsio;

namespace {

std::vector<uint8_t> ascii(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

// Test 1: CRC-16/CCITT-FALSE check value
TEST(CrcTest, Crc16CheckValue) {
    auto data = ascii("123456789");
    EXPECT_EQ(crc16_ccitt_false(data), 0x29B1);
}

// Test 2: Empty input leaves the initial value
TEST(CrcTest, Crc16Empty) {
    EXPECT_EQ(crc16_ccitt_false(std::span<const uint8_t>{}), 0xFFFF);
}

// Test 3: A buffer followed by its own CRC checks to zero
TEST(CrcTest, Crc16ResidueIsZero) {
    std::vector<uint8_t> data{0x18, 0x23, 0xC0, 0x2A, 0x00, 0x09, 0x2F, 0x11, 0x01};
    uint16_t crc = crc16_ccitt_false(data);
    data.push_back(static_cast<uint8_t>(crc >> 8));
    data.push_back(static_cast<uint8_t>(crc & 0xFF));

    EXPECT_EQ(crc16_ccitt_false(data), 0);
}

// Test 4: Computing in pieces matches a single pass
TEST(CrcTest, Crc16Incremental) {
    auto data = ascii("123456789");
    std::span<const uint8_t> all(data);

    uint16_t partial = crc16_ccitt_false(all.first(4));
    EXPECT_EQ(crc16_ccitt_false(all.subspan(4), partial), 0x29B1);
}

// Test 5: CRC-32 check value
TEST(CrcTest, Crc32CheckValue) {
    auto data = ascii("123456789");
    EXPECT_EQ(crc32(data), 0xCBF43926U);
}

// Test 6: A single flipped bit changes both CRCs
TEST(CrcTest, DetectsSingleBitFlip) {
    auto data = ascii("CCSDS File Delivery Protocol");
    uint16_t crc16 = crc16_ccitt_false(data);
    uint32_t crc32_value = crc32(data);

    data[5] ^= 0x10;
    EXPECT_NE(crc16_ccitt_false(data), crc16);
    EXPECT_NE(crc32(data), crc32_value);
}

// Test 7: Usable in constant expressions
TEST(CrcTest, Constexpr) {
    constexpr std::array<uint8_t, 9> data{'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    static_assert(crc16_ccitt_false(data) == 0x29B1);
    static_assert(crc32(data) == 0xCBF43926U);
    SUCCEED();
}
