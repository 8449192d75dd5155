#pragma once

#include <cstdint>
#include <span>

#include "pus_tc.hpp"
#include "pus_tm.hpp"
#include "services.hpp"

namespace ccsdsio::pus {

// Are-you-alive connection test request (TC[17,1])
inline PusTc make_ping_tc(uint16_t apid) {
    return make_pus_tc(apid, static_cast<uint8_t>(Service::s17_test),
                       static_cast<uint8_t>(TestSubservice::tc_ping));
}

// Are-you-alive connection test report (TM[17,2])
inline PusTm make_ping_reply(uint16_t apid, std::span<const uint8_t> timestamp) {
    return make_pus_tm(apid, static_cast<uint8_t>(Service::s17_test),
                       static_cast<uint8_t>(TestSubservice::tm_reply), timestamp);
}

inline bool is_ping_reply(const PusTm& tm) noexcept {
    return tm.secondary.service == static_cast<uint8_t>(Service::s17_test) &&
           tm.secondary.subservice == static_cast<uint8_t>(TestSubservice::tm_reply);
}

} // namespace ccsdsio::pus
