// Quickstart Test: Send a PUS Telecommand
//
// This test demonstrates building a PUS-C ping telecommand, stamping it
// with a sequence count and reading it back on the receiving side.
//
// The code between snippet markers can be extracted for documentation.

#include <cstdint>

#include <ccsdsio.hpp>
#include <gtest/gtest.h>

TEST(QuickstartSnippet, SendPingTelecommand) {
    // [QUICKSTART-DESC]
    // This example demonstrates a complete telecommand round trip:
    // - Space packet primary header with TC type and secondary header flag
    // - PUS-C secondary header (service 17, subservice 1)
    // - 14-bit sequence count taken from a SequenceCounter
    // - Packet error control CRC appended and checked on decode
    // [/QUICKSTART-DESC]

    // [QUICKSTART]
    // One counter per APID, owned by the sender
    ccsdsio::SequenceCounter counter;

    // Are-you-alive request to APID 0x023
    auto ping = ccsdsio::pus::make_ping_tc(0x023);
    ping.secondary.source_id = 7;

    // Encode: fills in the sequence count, data length and CRC
    auto bytes = ccsdsio::pus::encode_pus_tc(ping, counter);
    if (!bytes) {
        FAIL() << ccsdsio::validation_error_string(bytes.error());
    }

    // Receiving side: decode and dispatch on the service type
    auto received = ccsdsio::pus::decode_pus_tc(*bytes);
    if (received.ok() && received->secondary.service == 17) {
        // Reply with TM[17,2]
    }
    // [/QUICKSTART]

    ASSERT_TRUE(received.ok());
    EXPECT_EQ(received->sp_header.apid, 0x023);
    EXPECT_EQ(received->sp_header.sequence_count, 0);
    EXPECT_EQ(received->secondary.subservice, 1);
    EXPECT_EQ(received->secondary.source_id, 7);
    EXPECT_EQ(counter.peek(), 1);
}
