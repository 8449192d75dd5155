#include <array>
#include <chrono>
#include <cstdint>
#include <vector>

#include <ccsdsio/time/cds.hpp>
#include <gtest/gtest.h>

using namespace ccsdsio;
using namespace std::chrono;

// Test 1: The short form used by PUS telemetry
TEST(CdsTest, ShortFormat) {
    EXPECT_EQ(cds_short_format.p_field(), 0x40);
    EXPECT_EQ(cds_short_format.t_field_length(), 6U);
    EXPECT_EQ(cds_short_format.encoded_length(), 7U);
}

// Test 2: 2024-01-01T00:00:00Z is day 24106 of the 1958 epoch
TEST(CdsTest, EncodeKnownDate) {
    system_clock::time_point tp(seconds(1'704'067'200));

    auto code = make_cds(tp, cds_short_format, Epoch::ccsds_1958());
    ASSERT_TRUE(code.ok());
    EXPECT_EQ(code->day, 24106U);
    EXPECT_EQ(code->ms_of_day, 0U);

    auto bytes = encode_cds(*code);
    ASSERT_TRUE(bytes.ok());
    std::vector<uint8_t> expected{0x40, 0x5E, 0x2A, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(*bytes, expected);
}

// Test 3: Sub-millisecond resolutions
TEST(CdsTest, SubMillisecond) {
    auto tp = Epoch::ccsds_1958().to_time_point() + hours(48) + microseconds(3'501);

    auto ms = make_cds(tp, CdsFormat{}, Epoch::ccsds_1958());
    ASSERT_TRUE(ms.ok());
    EXPECT_EQ(ms->day, 2U);
    EXPECT_EQ(ms->ms_of_day, 3U);
    EXPECT_EQ(ms->submillisecond, 0U);

    CdsFormat us_format{false, false, CdsResolution::microseconds};
    auto us = make_cds(tp, us_format, Epoch::ccsds_1958());
    ASSERT_TRUE(us.ok());
    EXPECT_EQ(us->submillisecond, 501U);
    EXPECT_EQ(us_format.p_field(), 0x41);

    CdsFormat ps_format{false, false, CdsResolution::picoseconds};
    auto ps = make_cds(tp, ps_format, Epoch::ccsds_1958());
    ASSERT_TRUE(ps.ok());
    EXPECT_EQ(ps->submillisecond, 501'000'000U);

    auto bytes = encode_cds(*us);
    ASSERT_TRUE(bytes.ok());
    std::vector<uint8_t> expected{0x41, 0x00, 0x02, 0x00, 0x00, 0x00, 0x03, 0x01, 0xF5};
    EXPECT_EQ(*bytes, expected);
}

// Test 4: Decode back to a time point
TEST(CdsTest, DecodeToTimePoint) {
    std::array<uint8_t, 9> bytes{0x41, 0x00, 0x02, 0x00, 0x00, 0x00, 0x03, 0x01, 0xF5};

    auto code = decode_cds(bytes);
    ASSERT_TRUE(code.ok());
    EXPECT_EQ(code->format.resolution, CdsResolution::microseconds);
    EXPECT_EQ(code->day, 2U);
    EXPECT_EQ(code->submillisecond, 501U);
    auto tp = code->to_time_point(Epoch::ccsds_1958());
    ASSERT_TRUE(tp.ok());
    EXPECT_EQ(*tp, Epoch::ccsds_1958().to_time_point() + hours(48) + microseconds(3'501));
}

// Test 5: 24-bit day segment with an agency epoch
TEST(CdsTest, LongDayAgencyEpoch) {
    CdsFormat format{true, true, CdsResolution::milliseconds};
    EXPECT_EQ(format.p_field(), 0x4C);

    CdsTimeCode code{format, 70'000, 1234, 0};
    auto bytes = encode_cds(code);
    ASSERT_TRUE(bytes.ok());
    ASSERT_EQ(bytes->size(), 8U);

    auto decoded = decode_cds(*bytes);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, code);
}

// Test 6: Day overflow and times before the epoch
TEST(CdsTest, MakeOutOfRange) {
    auto late = Epoch::unix_1970().to_time_point() + hours(24 * 70'000);
    EXPECT_EQ(make_cds(late, CdsFormat{}, Epoch::unix_1970()).error(),
              ValidationError::value_out_of_range);

    CdsFormat wide{false, true, CdsResolution::milliseconds};
    EXPECT_TRUE(make_cds(late, wide, Epoch::unix_1970()).ok());

    auto before = Epoch::ccsds_1958().to_time_point() - milliseconds(1);
    EXPECT_EQ(make_cds(before, CdsFormat{}, Epoch::ccsds_1958()).error(),
              ValidationError::value_out_of_range);
}

// Test 7: Encoding validates each segment
TEST(CdsTest, EncodeRejectsInvalid) {
    EXPECT_EQ(encode_cds(CdsTimeCode{CdsFormat{}, 0x10000, 0, 0}).error(),
              ValidationError::value_out_of_range);
    EXPECT_EQ(encode_cds(CdsTimeCode{CdsFormat{}, 0, cds_max_ms_of_day, 0}).error(),
              ValidationError::value_out_of_range);
    EXPECT_TRUE(encode_cds(CdsTimeCode{CdsFormat{}, 0, cds_max_ms_of_day - 1, 0}).ok());

    CdsFormat us_format{false, false, CdsResolution::microseconds};
    EXPECT_EQ(encode_cds(CdsTimeCode{us_format, 0, 0, 1000}).error(),
              ValidationError::value_out_of_range);

    CdsFormat ps_format{false, false, CdsResolution::picoseconds};
    EXPECT_EQ(encode_cds(CdsTimeCode{ps_format, 0, 0, cds_picoseconds_per_ms}).error(),
              ValidationError::value_out_of_range);
    EXPECT_TRUE(encode_cds(CdsTimeCode{ps_format, 0, 0, cds_picoseconds_per_ms - 1}).ok());
}

// Test 8: Reserved resolution code, wrong id and truncation
TEST(CdsTest, DecodeErrors) {
    std::array<uint8_t, 7> reserved{0x43, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(decode_cds(reserved).error(), ValidationError::invalid_p_field);

    std::array<uint8_t, 7> cuc{0x1E, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(decode_cds(cuc).error(), ValidationError::invalid_p_field);

    std::array<uint8_t, 5> short_buf{0x40, 0, 0, 0, 0};
    EXPECT_EQ(decode_cds(short_buf).error(), ValidationError::buffer_underflow);

    std::array<uint8_t, 7> missing_us{0x41, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(decode_cds(missing_us).error(), ValidationError::buffer_underflow);
}

// Test 9: Day counts beyond the reach of std::chrono::nanoseconds
TEST(CdsTest, LongDayOutsideClockRange) {
    CdsFormat wide{false, true, CdsResolution::picoseconds};

    CdsTimeCode last{wide, 0xFFFFFF, cds_max_ms_of_day - 1, cds_picoseconds_per_ms - 1};
    ASSERT_TRUE(encode_cds(last).ok());
    EXPECT_EQ(last.since_epoch().error(), ValidationError::value_out_of_range);
    EXPECT_EQ(last.to_time_point(Epoch::ccsds_1958()).error(), ValidationError::value_out_of_range);

    CdsTimeCode edge{wide, 106'751, 0, 0};
    auto elapsed = edge.since_epoch();
    ASSERT_TRUE(elapsed.ok());
    EXPECT_EQ(*elapsed, hours(24) * 106'751);

    edge.day = 106'752;
    EXPECT_EQ(edge.since_epoch().error(), ValidationError::value_out_of_range);
}
