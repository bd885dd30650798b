#pragma once

#include "gnss_rtk_bridge/fix_record.hpp"
#include "gnss_rtk_bridge/geodesy.hpp"
#include "gnss_rtk_bridge/nmea_parser.hpp"

#include <string>
#include <vector>

namespace gnss_rtk_bridge {

/// "$<talker><type>,<fields...>*HH\r\n"
std::string encodeSentence(const std::string &talker, const std::string &type,
                           const std::vector<std::string> &fields);

// ddmm.mmmm / dddmm.mmmm plus hemisphere letter.
std::string formatLatitude(double lat_deg, char &hemisphere);
std::string formatLongitude(double lon_deg, char &hemisphere);
std::string formatTime(const UtcTime &time);

// Unset values of the record become empty fields.
std::string encodeGga(const FixRecord &fix);
std::string encodeRmc(const FixRecord &fix);
std::string encodeVtg(const FixRecord &fix);

/// GGA reporting a rover position to a caster (fix quality 1, 10 satellites,
/// HDOP 1, station 0000).
std::string formatGgaForPosition(const GeodeticCoordinate &position, const UtcTime &time);
std::string formatGgaForPosition(const GeodeticCoordinate &position);

UtcTime utcNow();

} // namespace gnss_rtk_bridge
