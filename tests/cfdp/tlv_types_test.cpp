#include <cstdint>
#include <string>
#include <vector>

#include <ccsdsio/cfdp/tlv_types.hpp>
#include <gtest/gtest.h>

using namespace ccsdsio;
using namespace ccsdsio::cfdp;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

// Test 1: Remove directory response for a single file name
TEST(TlvTypesTest, FilestoreResponseRemoveDirectory) {
    FilestoreResponseTlv response;
    response.action = FilestoreActionCode::remove_directory;
    response.status_code = filestore_status_successful;
    response.first_file_name = "test.txt";

    auto tlv = response.to_tlv();
    ASSERT_TRUE(tlv.ok());
    auto bytes = encode_tlv(*tlv);
    ASSERT_TRUE(bytes.ok());

    std::vector<uint8_t> expected{0x01, 0x0B, 0x60, 0x08};
    auto name = bytes_of("test.txt");
    expected.insert(expected.end(), name.begin(), name.end());
    expected.push_back(0x00);
    EXPECT_EQ(*bytes, expected);
    EXPECT_EQ(bytes->size(), 13U);
}

// Test 2: Append response carries both names
TEST(TlvTypesTest, FilestoreResponseAppend) {
    FilestoreResponseTlv response;
    response.action = FilestoreActionCode::append_file;
    response.status_code = filestore_status_not_performed;
    response.first_file_name = "test.txt";
    response.second_file_name = "test2.txt";

    auto tlv = response.to_tlv();
    ASSERT_TRUE(tlv.ok());
    auto bytes = encode_tlv(*tlv);
    ASSERT_TRUE(bytes.ok());
    ASSERT_EQ(bytes->size(), 23U);
    EXPECT_EQ((*bytes)[0], 0x01);
    EXPECT_EQ((*bytes)[1], 0x15);
    EXPECT_EQ((*bytes)[2], 0x3F);

    auto decoded = FilestoreResponseTlv::from_tlv(*tlv);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, response);
}

// Test 3: Single-name actions ignore the second name
TEST(TlvTypesTest, FilestoreRequest) {
    FilestoreRequestTlv request;
    request.action = FilestoreActionCode::delete_file;
    request.first_file_name = "/tmp/a";
    request.second_file_name = "ignored";

    auto tlv = request.to_tlv();
    ASSERT_TRUE(tlv.ok());
    EXPECT_EQ(tlv->value.size(), 1U + 1U + 6U);
    EXPECT_EQ(tlv->value[0], 0x10);

    auto decoded = FilestoreRequestTlv::from_tlv(*tlv);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->first_file_name, "/tmp/a");
    EXPECT_TRUE(decoded->second_file_name.empty());

    FilestoreRequestTlv rename;
    rename.action = FilestoreActionCode::rename_file;
    rename.first_file_name = "a";
    rename.second_file_name = "b";
    auto rename_tlv = rename.to_tlv();
    ASSERT_TRUE(rename_tlv.ok());
    EXPECT_EQ(FilestoreRequestTlv::from_tlv(*rename_tlv).value_or({}), rename);
}

// Test 4: Unknown action codes are rejected
TEST(TlvTypesTest, FilestoreInvalidAction) {
    Tlv tlv(TlvType::filestore_request, {0x90, 0x00});
    EXPECT_EQ(FilestoreRequestTlv::from_tlv(tlv).error(), ValidationError::invalid_field_value);
}

// Test 5: Entity id TLV width follows the value
TEST(TlvTypesTest, EntityId) {
    EntityIdTlv entity{2, 2};
    auto tlv = entity.to_tlv();
    ASSERT_TRUE(tlv.ok());
    EXPECT_EQ(tlv->encoded_length(), 4U);
    EXPECT_EQ(tlv->value, (std::vector<uint8_t>{0x00, 0x02}));

    auto decoded = EntityIdTlv::from_tlv(*tlv);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, entity);

    EXPECT_EQ((EntityIdTlv{256, 1}).to_tlv().error(), ValidationError::value_too_large);
    EXPECT_EQ(EntityIdTlv::from_tlv(Tlv(TlvType::entity_id, {})).error(),
              ValidationError::invalid_length_field);
}

// Test 6: Converting from a TLV of another type
TEST(TlvTypesTest, TypeMismatch) {
    Tlv flow(TlvType::flow_label, {0x01});
    EXPECT_EQ(EntityIdTlv::from_tlv(flow).error(), ValidationError::tlv_type_mismatch);
    EXPECT_EQ(MessageToUserTlv::from_tlv(flow).error(), ValidationError::tlv_type_mismatch);
    EXPECT_EQ(FilestoreResponseTlv::from_tlv(flow).error(), ValidationError::tlv_type_mismatch);
    EXPECT_TRUE(FlowLabelTlv::from_tlv(flow).ok());
}

// Test 7: Reserved CFDP messages are recognised by their marker
TEST(TlvTypesTest, MessageToUserReserved) {
    MessageToUserTlv plain{{0x00}};
    EXPECT_FALSE(plain.is_reserved_cfdp_message());
    EXPECT_EQ(plain.reserved_message_type().error(), ValidationError::invalid_field_value);

    MessageToUserTlv marker_only{bytes_of("cfdp")};
    EXPECT_FALSE(marker_only.is_reserved_cfdp_message());

    auto proxy = bytes_of("cfdp");
    proxy.push_back(0x00);
    MessageToUserTlv reserved{proxy};
    EXPECT_TRUE(reserved.is_reserved_cfdp_message());
    EXPECT_EQ(reserved.reserved_message_type().value_or(0xFF), 0x00);

    auto tlv = reserved.to_tlv();
    ASSERT_TRUE(tlv.ok());
    EXPECT_TRUE(tlv->is(TlvType::message_to_user));
    EXPECT_EQ(MessageToUserTlv::from_tlv(*tlv).value_or({}), reserved);
}

// Test 8: Fault handler override packs both nibbles into one octet
TEST(TlvTypesTest, FaultHandlerOverride) {
    FaultHandlerOverrideTlv fault{ConditionCode::file_checksum_failure,
                                  FaultHandlerCode::abandon_transaction};
    auto tlv = fault.to_tlv();
    ASSERT_TRUE(tlv.ok());
    EXPECT_EQ(tlv->value, (std::vector<uint8_t>{0x54}));

    auto decoded = FaultHandlerOverrideTlv::from_tlv(*tlv);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, fault);

    Tlv bad_handler(TlvType::fault_handler_override, {0x50});
    EXPECT_EQ(FaultHandlerOverrideTlv::from_tlv(bad_handler).error(),
              ValidationError::invalid_field_value);
}

// Test 9: Filestore action codes are four bits wide
TEST(TlvTypesTest, FilestoreActionOutOfRange) {
    FilestoreRequestTlv request;
    request.action = static_cast<FilestoreActionCode>(0x10);
    request.first_file_name = "a";
    EXPECT_EQ(request.to_tlv().error(), ValidationError::value_too_large);

    FilestoreResponseTlv response;
    response.action = static_cast<FilestoreActionCode>(0x10);
    response.first_file_name = "a";
    EXPECT_EQ(response.to_tlv().error(), ValidationError::value_too_large);
}
