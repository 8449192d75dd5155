#include <cstdint>
#include <vector>

#include "cfdp_test_fixture.hpp"

using namespace ccsdsio;
using namespace ccsdsio::cfdp;

using FileDataPduTest = CfdpPduTest;

// Test 1: Offset and data without segment metadata
TEST_F(FileDataPduTest, PlainSegment) {
    FileDataPdu file_data;
    file_data.offset = 0x200;
    file_data.data = {0xDE, 0xAD, 0xBE, 0xEF};

    Pdu pdu{file_data_header(), file_data};
    EXPECT_TRUE(pdu.is_file_data());
    EXPECT_FALSE(pdu.directive_code().has_value());

    auto bytes = codec_.encode(pdu);
    ASSERT_TRUE(bytes.ok());
    EXPECT_EQ(*bytes, with_header(0x30, {0x00, 0x00, 0x02, 0x00, 0xDE, 0xAD, 0xBE, 0xEF}));

    auto decoded = codec_.decode(*bytes);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->header.pdu_type, PduType::file_data);
    EXPECT_EQ(*decoded->get_if<FileDataPdu>(), file_data);
}

// Test 2: Segment metadata ahead of the offset
TEST_F(FileDataPduTest, SegmentMetadata) {
    auto header = file_data_header();
    header.segment_metadata_flag = true;

    FileDataPdu file_data;
    file_data.offset = 16;
    file_data.data = {0x01, 0x02};
    file_data.segment_metadata =
        SegmentMetadata{RecordContinuationState::start_and_end, {0xAA, 0xBB}};

    auto bytes = codec_.encode(Pdu{header, file_data});
    ASSERT_TRUE(bytes.ok());
    std::vector<uint8_t> expected{0x30, 0x00, 0x09, 0x08, 0x00, 0x00, 0x00, 0xC2,
                                  0xAA, 0xBB, 0x00, 0x00, 0x00, 0x10, 0x01, 0x02};
    EXPECT_EQ(*bytes, expected);

    auto decoded = codec_.decode(expected);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded->header.segment_metadata_flag);
    EXPECT_EQ(*decoded->get_if<FileDataPdu>(), file_data);
}

// Test 3: Segment metadata and the header flag must agree
TEST_F(FileDataPduTest, MetadataFlagMismatch) {
    FileDataPdu file_data;
    file_data.segment_metadata = SegmentMetadata{};
    EXPECT_EQ(codec_.encode(Pdu{file_data_header(), file_data}).error(),
              ValidationError::invalid_field_value);

    auto header = file_data_header();
    header.segment_metadata_flag = true;
    EXPECT_EQ(codec_.encode(Pdu{header, FileDataPdu{}}).error(),
              ValidationError::invalid_field_value);
}

// Test 4: Segment metadata is limited to 63 bytes
TEST_F(FileDataPduTest, MetadataTooLong) {
    auto header = file_data_header();
    header.segment_metadata_flag = true;

    FileDataPdu file_data;
    file_data.segment_metadata = SegmentMetadata{};
    file_data.segment_metadata->metadata.assign(max_segment_metadata_length + 1, 0x55);
    EXPECT_EQ(codec_.encode(Pdu{header, file_data}).error(), ValidationError::value_too_large);

    file_data.segment_metadata->metadata.resize(max_segment_metadata_length);
    EXPECT_TRUE(codec_.encode(Pdu{header, file_data}).ok());
}

// Test 5: Empty data after the offset is allowed
TEST_F(FileDataPduTest, EmptyData) {
    auto decoded = codec_.decode(with_header(0x30, {0x00, 0x00, 0x00, 0x08}));
    ASSERT_TRUE(decoded.ok());
    const auto* body = decoded->get_if<FileDataPdu>();
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->offset, 8U);
    EXPECT_TRUE(body->data.empty());
}

// Test 6: A data field shorter than the offset
TEST_F(FileDataPduTest, TruncatedOffset) {
    EXPECT_EQ(codec_.decode(with_header(0x30, {0x00, 0x00, 0x01})).error(),
              ValidationError::buffer_underflow);

    std::vector<uint8_t> metadata_cut{0x30, 0x00, 0x02, 0x08, 0x00, 0x00, 0x00, 0x43, 0xAA};
    EXPECT_EQ(codec_.decode(metadata_cut).error(), ValidationError::buffer_underflow);
}

// Test 7: Segment metadata flag on a directive is rejected
TEST_F(FileDataPduTest, MetadataFlagOnDirective) {
    auto header = directive_header();
    header.segment_metadata_flag = true;
    EXPECT_EQ(codec_.encode(Pdu{header, EofPdu{}}).error(), ValidationError::invalid_field_value);
}

// Test 8: Record continuation state is two bits wide
TEST_F(FileDataPduTest, RecordContinuationOutOfRange) {
    auto header = file_data_header();
    header.segment_metadata_flag = true;

    FileDataPdu file_data;
    file_data.segment_metadata = SegmentMetadata{static_cast<RecordContinuationState>(4), {0xAA}};
    EXPECT_EQ(codec_.encode(Pdu{header, file_data}).error(), ValidationError::value_too_large);
}
