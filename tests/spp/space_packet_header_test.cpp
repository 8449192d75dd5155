#include <array>
#include <cstdint>
#include <vector>

#include <ccsdsio/spp/space_packet.hpp>
#include <ccsdsio/spp/space_packet_header.hpp>
#include <gtest/gtest.h>

using namespace ccsdsio;

namespace {

SpacePacketHeader make_tc_header(uint16_t apid, bool secondary_header, uint16_t count) {
    SpacePacketHeader h;
    h.packet_type = SpacePacketType::telecommand;
    h.secondary_header_flag = secondary_header;
    h.apid = apid;
    h.sequence_flags = SequenceFlags::unsegmented;
    h.sequence_count = count;
    return h;
}

} // namespace

// Test 1: TC with secondary header, apid 0x023, count 42, 10 byte payload
TEST(SpacePacketHeaderTest, EncodeReferenceBytes) {
    auto bytes = encode_space_packet_header(make_tc_header(0x023, true, 42), 10);
    ASSERT_TRUE(bytes.ok());

    std::array<uint8_t, 6> expected{0x18, 0x23, 0xC0, 0x2A, 0x00, 0x09};
    EXPECT_EQ(*bytes, expected);
}

// Test 2: Same packet on apid 0x123 without a secondary header
TEST(SpacePacketHeaderTest, EncodeApid0x123) {
    auto bytes = encode_space_packet_header(make_tc_header(0x123, false, 42), 10);
    ASSERT_TRUE(bytes.ok());

    std::array<uint8_t, 6> expected{0x11, 0x23, 0xC0, 0x2A, 0x00, 0x09};
    EXPECT_EQ(*bytes, expected);
}

// Test 3: Decoding the reference bytes
TEST(SpacePacketHeaderTest, DecodeReferenceBytes) {
    std::array<uint8_t, 6> bytes{0x18, 0x23, 0xC0, 0x2A, 0x00, 0x09};

    auto header = decode_space_packet_header(bytes);
    ASSERT_TRUE(header.ok());
    EXPECT_EQ(header->version, 0);
    EXPECT_EQ(header->packet_type, SpacePacketType::telecommand);
    EXPECT_TRUE(header->secondary_header_flag);
    EXPECT_EQ(header->apid, 0x023);
    EXPECT_EQ(header->sequence_flags, SequenceFlags::unsegmented);
    EXPECT_EQ(header->sequence_count, 42);
    EXPECT_EQ(header->data_length, 9);
    EXPECT_EQ(header->payload_length(), 10U);
    EXPECT_EQ(header->packet_length(), 16U);
    EXPECT_EQ(header->packet_id(), 0x1823);
    EXPECT_EQ(header->packet_sequence_control(), 0xC02A);
}

// Test 4: Decode(encode(h)) reproduces h with data_length filled in
TEST(SpacePacketHeaderTest, RoundTrip) {
    SpacePacketHeader h;
    h.packet_type = SpacePacketType::telemetry;
    h.apid = max_apid;
    h.sequence_flags = SequenceFlags::first_segment;
    h.sequence_count = max_sequence_count;

    auto bytes = encode_space_packet_header(h, max_packet_data_bytes);
    ASSERT_TRUE(bytes.ok());
    auto decoded = decode_space_packet_header(*bytes);
    ASSERT_TRUE(decoded.ok());

    h.data_length = 0xFFFF;
    EXPECT_EQ(*decoded, h);
}

// Test 5: Out-of-range fields
TEST(SpacePacketHeaderTest, EncodeRejectsOutOfRange) {
    EXPECT_EQ(encode_space_packet_header(make_tc_header(0x800, false, 0), 1).error(),
              ValidationError::value_too_large);
    EXPECT_EQ(encode_space_packet_header(make_tc_header(1, false, 16384), 1).error(),
              ValidationError::value_too_large);
    EXPECT_EQ(encode_space_packet_header(make_tc_header(1, false, 0), 0).error(),
              ValidationError::value_out_of_range);
    EXPECT_EQ(encode_space_packet_header(make_tc_header(1, false, 0), 65537).error(),
              ValidationError::value_out_of_range);

    auto h = make_tc_header(1, false, 0);
    h.version = 1;
    EXPECT_EQ(encode_space_packet_header(h, 1).error(), ValidationError::reserved_version);

    h = make_tc_header(1, false, 0);
    h.packet_type = static_cast<SpacePacketType>(2);
    EXPECT_EQ(encode_space_packet_header(h, 1).error(), ValidationError::value_too_large);
    h = make_tc_header(1, false, 0);
    h.sequence_flags = static_cast<SequenceFlags>(4);
    EXPECT_EQ(encode_space_packet_header(h, 1).error(), ValidationError::value_too_large);
}

// Test 6: Short buffers and reserved versions on decode
TEST(SpacePacketHeaderTest, DecodeErrors) {
    std::array<uint8_t, 5> short_buf{0x18, 0x23, 0xC0, 0x2A, 0x00};
    EXPECT_EQ(decode_space_packet_header(short_buf).error(), ValidationError::truncated_header);

    std::array<uint8_t, 6> version1{0x38, 0x23, 0xC0, 0x2A, 0x00, 0x09};
    EXPECT_EQ(decode_space_packet_header(version1).error(), ValidationError::reserved_version);
}

// Test 7: Whole packet encode and decode
TEST(SpacePacketTest, EncodeDecodePacket) {
    std::vector<uint8_t> payload{0xDE, 0xAD, 0xBE, 0xEF};
    auto packet = encode_space_packet(make_tc_header(0x42, false, 7), payload);
    ASSERT_TRUE(packet.ok());
    ASSERT_EQ(packet->size(), 10U);

    auto length = space_packet_length(*packet);
    ASSERT_TRUE(length.ok());
    EXPECT_EQ(*length, 10U);

    auto decoded = decode_space_packet(*packet);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->header.apid, 0x42);
    EXPECT_EQ(decoded->header.sequence_count, 7);
    EXPECT_EQ(decoded->payload, payload);
}

// Test 8: Packets in a stream are split by their declared length
TEST(SpacePacketTest, DecodeIgnoresFollowingBytes) {
    std::vector<uint8_t> payload{0x01};
    auto first = encode_space_packet(make_tc_header(1, false, 0), payload);
    ASSERT_TRUE(first.ok());

    std::vector<uint8_t> stream = *first;
    stream.push_back(0xFF);
    stream.push_back(0xFF);

    auto decoded = decode_space_packet(stream);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->payload.size(), 1U);
}

// Test 9: A packet shorter than its declared length
TEST(SpacePacketTest, DecodeTruncatedPayload) {
    std::array<uint8_t, 8> bytes{0x18, 0x23, 0xC0, 0x2A, 0x00, 0x09, 0x00, 0x00};
    EXPECT_EQ(decode_space_packet(bytes).error(), ValidationError::buffer_underflow);
}

// Test 10: The counter stamps each packet and advances only on success
TEST(SpacePacketTest, CounterStampsPackets) {
    SequenceCounter counter;
    std::vector<uint8_t> payload{0xAA};
    auto header = make_tc_header(0x10, false, 0);

    auto p0 = encode_space_packet(header, payload, counter);
    auto p1 = encode_space_packet(header, payload, counter);
    ASSERT_TRUE(p0.ok());
    ASSERT_TRUE(p1.ok());
    EXPECT_EQ(decode_space_packet_header(*p0)->sequence_count, 0);
    EXPECT_EQ(decode_space_packet_header(*p1)->sequence_count, 1);

    auto bad = encode_space_packet(header, std::span<const uint8_t>{}, counter);
    EXPECT_EQ(bad.error(), ValidationError::value_out_of_range);
    EXPECT_EQ(counter.peek(), 2);
}
