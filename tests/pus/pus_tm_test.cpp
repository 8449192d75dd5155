#include <array>
#include <chrono>
#include <cstdint>
#include <vector>

#include <ccsdsio/core/crc.hpp>
#include <ccsdsio/pus/pus_tm.hpp>
#include <ccsdsio/pus/service_17.hpp>
#include <ccsdsio/time/cds.hpp>
#include <gtest/gtest.h>

using namespace ccsdsio;
using namespace ccsdsio::pus;

namespace {

std::vector<uint8_t> cds_timestamp() {
    CdsTimeCode code{cds_short_format, 24106, 1000, 0};
    return encode_cds(code).value_or({});
}

} // namespace

// Test 1: Ping reply with a CDS short timestamp
TEST(PusTmTest, PingReplyLayout) {
    auto stamp = cds_timestamp();
    ASSERT_EQ(stamp.size(), 7U);

    auto tm = make_ping_reply(0x22, stamp);
    auto bytes = encode_pus_tm(tm);
    ASSERT_TRUE(bytes.ok());
    ASSERT_EQ(bytes->size(), 6U + 7U + 7U + 2U);

    const auto& b = *bytes;
    EXPECT_EQ((b[0] << 8) | b[1], 0x0822);
    EXPECT_EQ(b[6], 0x20); // PUS-C, time reference 0
    EXPECT_EQ(b[7], 17);
    EXPECT_EQ(b[8], 2);
    EXPECT_EQ(b[13], 0x40); // timestamp P-field
    EXPECT_EQ(crc16_ccitt_false(b), 0);

    auto service = pus_service(b);
    ASSERT_TRUE(service.ok());
    EXPECT_EQ(*service, 17);
}

// Test 2: Source data and counters survive a decode
TEST(PusTmTest, RoundTrip) {
    auto stamp = cds_timestamp();
    std::vector<uint8_t> source_data{0x42, 0x38};
    auto tm = make_pus_tm(0x22, 3, 25, stamp, source_data);
    tm.secondary.message_counter = 513;
    tm.secondary.destination_id = 7;
    tm.secondary.time_reference_status = 0x3;

    auto bytes = encode_pus_tm(tm);
    ASSERT_TRUE(bytes.ok());

    auto decoded = decode_pus_tm(*bytes, stamp.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->secondary, tm.secondary);
    EXPECT_EQ(decoded->source_data, source_data);
    EXPECT_FALSE(is_ping_reply(*decoded));

    auto time = decode_cds(decoded->secondary.timestamp);
    ASSERT_TRUE(time.ok());
    EXPECT_EQ(time->day, 24106U);
}

// Test 3: Trailing bytes past the packet are ignored
TEST(PusTmTest, ExtraBytesIgnored) {
    auto stamp = cds_timestamp();
    auto bytes = encode_pus_tm(make_ping_reply(0x22, stamp));
    ASSERT_TRUE(bytes.ok());
    auto padded = *bytes;
    padded.push_back(0x00);

    auto decoded = decode_pus_tm(padded, stamp.size());
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(is_ping_reply(*decoded));
}

// Test 4: Wrong data length fields
TEST(PusTmTest, InvalidLengthField) {
    auto stamp = cds_timestamp();
    auto bytes = encode_pus_tm(make_ping_reply(0x22, stamp));
    ASSERT_TRUE(bytes.ok());

    auto zero = *bytes;
    zero[4] = 0x00;
    zero[5] = 0x00;
    EXPECT_EQ(decode_pus_tm(zero, stamp.size()).error(), ValidationError::buffer_underflow);

    auto huge = *bytes;
    huge[4] = 0xFF;
    huge[5] = 0xFF;
    EXPECT_EQ(decode_pus_tm(huge, stamp.size()).error(), ValidationError::buffer_underflow);
}

// Test 5: CRC mismatch keeps the telemetry
TEST(PusTmTest, CrcMismatch) {
    auto stamp = cds_timestamp();
    auto bytes = encode_pus_tm(make_ping_reply(0x22, stamp));
    ASSERT_TRUE(bytes.ok());
    auto corrupted = *bytes;
    corrupted.back() ^= 0xFF;

    auto decoded = decode_pus_tm(corrupted, stamp.size());
    EXPECT_EQ(decoded.error(), ValidationError::crc_mismatch);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(is_ping_reply(*decoded));
}

// Test 6: Counter stamping
TEST(PusTmTest, SequenceCounter) {
    SequenceCounter counter;
    auto stamp = cds_timestamp();
    for (int i = 0; i < 3; ++i) {
        auto bytes = encode_pus_tm(make_ping_reply(0x22, stamp), counter);
        ASSERT_TRUE(bytes.ok());
        EXPECT_EQ(decode_space_packet_header(*bytes)->sequence_count, i);
    }
}

// Test 7: Service peek on short input
TEST(PusTmTest, ServiceFromShortBuffer) {
    EXPECT_EQ(pus_service(std::span<const uint8_t>{}).error(), ValidationError::buffer_underflow);

    std::array<uint8_t, 7> header_only{0x08, 0x22, 0xC0, 0x00, 0x00, 0x10, 0x20};
    EXPECT_EQ(pus_service(header_only).error(), ValidationError::buffer_underflow);
}
