#pragma once

#include <cstdint>

namespace ccsdsio::pus {

// Standard service type identifiers (ECSS-E-ST-70-41C)
enum class Service : uint8_t {
    s1_request_verification = 1,
    s2_device_access = 2,
    s3_housekeeping = 3,
    s4_parameter_statistics = 4,
    s5_event_reporting = 5,
    s8_function_management = 8,
    s9_time_management = 9,
    s11_time_based_scheduling = 11,
    s17_test = 17,
    s20_parameter_management = 20,
    s23_file_management = 23,
    s200_mode_management = 200,
};

// Service 17 (test) message subtypes
enum class TestSubservice : uint8_t {
    tc_ping = 1,
    tm_reply = 2,
};

// Service 3 (housekeeping) message subtypes
enum class HousekeepingSubservice : uint8_t {
    tc_enable_periodic_hk_gen = 5,
    tc_disable_periodic_hk_gen = 6,
    tc_enable_periodic_diagnostics_gen = 7,
    tc_disable_periodic_diagnostics_gen = 8,
    tm_report_hk_report_structures = 9,
    tm_hk_definitions_report = 10,
    tm_report_diag_report_structures = 11,
    tm_diag_definition_report = 12,
    tm_hk_report = 25,
    tm_diagnostics_report = 26,
    tc_generate_one_parameter_report = 27,
    tc_generate_one_diagnostics_report = 28,
    tc_modify_parameter_report_collection_interval = 31,
    tc_modify_diagnostics_report_collection_interval = 32,
};

} // namespace ccsdsio::pus
