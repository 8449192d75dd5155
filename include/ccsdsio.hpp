#pragma once

// CCSDSIO - Lightweight CCSDS Packet Library
//
// A header-only C++20 library for building and parsing CCSDS packets and
// time codes over caller-owned byte buffers.
//
// Space Packet Features:
// - Space Packet primary header (CCSDS 133.0)
// - 14-bit sequence counter with wrap-around
// - PUS-C telecommand and telemetry packets with packet error control
// - Generic big-endian bit field reader and writer
//
// Time Code Features:
// - CCSDS Unsegmented Time Code (CUC), 1-4 coarse and 0-3 fine octets
// - CCSDS Day Segmented Time Code (CDS), 16/24-bit day with ms, us or ps
// - Explicit epochs (1958 CCSDS, Unix, agency-defined)
//
// CFDP Features:
// - PDU header with 1/2/4/8-byte entity ids and sequence numbers
// - Metadata, File-Data, EOF, ACK, NAK, Finished, Prompt and Keep Alive PDUs
// - LV/TLV codecs and typed filestore, message-to-user and fault TLVs
// - Optional CRC-16/CCITT-FALSE or CRC-32 PDU CRC
// - CFDP modular file checksum
//
// Frame Features:
// - USLP transfer frame primary header (CCSDS 732.1)

// ====================
// Public API
// ====================

// Core types, error codes and diagnostics
#include "ccsdsio/core/bit_field.hpp"
#include "ccsdsio/core/crc.hpp"
#include "ccsdsio/core/diagnostics.hpp"
#include "ccsdsio/core/result.hpp"
#include "ccsdsio/core/types.hpp"

// Space packets
#include "ccsdsio/spp/sequence_counter.hpp"
#include "ccsdsio/spp/space_packet.hpp"
#include "ccsdsio/spp/space_packet_header.hpp"

// Time codes
#include "ccsdsio/time/cds.hpp"
#include "ccsdsio/time/cuc.hpp"
#include "ccsdsio/time/epoch.hpp"
#include "ccsdsio/time/p_field.hpp"

// PUS
#include "ccsdsio/pus/pus_tc.hpp"
#include "ccsdsio/pus/pus_tm.hpp"
#include "ccsdsio/pus/service_17.hpp"
#include "ccsdsio/pus/services.hpp"

// CFDP
#include "ccsdsio/cfdp/checksum.hpp"
#include "ccsdsio/cfdp/config.hpp"
#include "ccsdsio/cfdp/defs.hpp"
#include "ccsdsio/cfdp/lv.hpp"
#include "ccsdsio/cfdp/pdu.hpp"
#include "ccsdsio/cfdp/pdu_codec.hpp"
#include "ccsdsio/cfdp/pdu_header.hpp"
#include "ccsdsio/cfdp/tlv.hpp"
#include "ccsdsio/cfdp/tlv_types.hpp"

// USLP
#include "ccsdsio/uslp/primary_header.hpp"
