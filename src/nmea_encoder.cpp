#include "gnss_rtk_bridge/nmea_encoder.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace gnss_rtk_bridge {

namespace {

constexpr double kMpsToKnots = 1.0 / 0.514444;
constexpr double kMpsToKmh = 3.6;
constexpr long long kTenThousandthsPerDegree = 60LL * 10000LL;

std::string fixed(double value, int decimals) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

template <typename T>
std::string optionalFixed(const std::optional<T> &value, int decimals) {
    return value ? fixed(*value, decimals) : std::string();
}

// Rounds to 1/10000 of a minute first so 59.99999' never prints as 60.0000.
std::string formatAngle(double value, int degree_digits) {
    const long long total = std::llround(std::fabs(value) * kTenThousandthsPerDegree);
    const long long deg = total / kTenThousandthsPerDegree;
    const long long rem = total % kTenThousandthsPerDegree;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*lld%02lld.%04lld", degree_digits, deg, rem / 10000, rem % 10000);
    return buf;
}

std::string formatDate(const UtcTime &time) {
    if (!time.year || !time.month || !time.day) return {};
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d", *time.day, *time.month, *time.year % 100);
    return buf;
}

void appendPosition(std::vector<std::string> &fields, const std::optional<GeodeticCoordinate> &pos) {
    if (!pos) {
        fields.insert(fields.end(), {"", "", "", ""});
        return;
    }
    char ns = 'N';
    char ew = 'E';
    fields.push_back(formatLatitude(pos->latitude(), ns));
    fields.emplace_back(1, ns);
    fields.push_back(formatLongitude(pos->longitude(), ew));
    fields.emplace_back(1, ew);
}

} // namespace

std::string encodeSentence(const std::string &talker, const std::string &type,
                           const std::vector<std::string> &fields) {
    std::string body = talker + type;
    for (const auto &field : fields) {
        body += ',';
        body += field;
    }
    char tail[8];
    std::snprintf(tail, sizeof(tail), "*%02X\r\n", NmeaParser::checksum(body));
    return "$" + body + tail;
}

std::string formatLatitude(double lat_deg, char &hemisphere) {
    hemisphere = lat_deg < 0 ? 'S' : 'N';
    return formatAngle(lat_deg, 2);
}

std::string formatLongitude(double lon_deg, char &hemisphere) {
    hemisphere = lon_deg < 0 ? 'W' : 'E';
    return formatAngle(lon_deg, 3);
}

std::string formatTime(const UtcTime &time) {
    // Centiseconds are truncated, not rounded.
    int centis = static_cast<int>(std::floor(time.second * 100.0 + 1e-6));
    if (centis > 5999) centis = 5999;
    if (centis < 0) centis = 0;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d.%02d", time.hour, time.minute, centis / 100, centis % 100);
    return buf;
}

//------------------------- Fix record sentences -------------------------
std::string encodeGga(const FixRecord &fix) {
    std::vector<std::string> fields;
    fields.push_back(fix.time ? formatTime(*fix.time) : std::string());
    appendPosition(fields, fix.position);
    fields.push_back(std::to_string(fixQualityToGga(fix.fixQuality())));
    fields.push_back(fix.satellites ? std::to_string(*fix.satellites) : std::string());
    fields.push_back(optionalFixed(fix.hdop, 2));
    if (fix.position && fix.position_has_altitude) {
        fields.push_back(fixed(fix.position->altitude(), 3));
        fields.push_back("M");
    } else {
        fields.insert(fields.end(), {"", ""});
    }
    // Geoid separation, correction age, station id
    fields.insert(fields.end(), {"", "", "", ""});
    return encodeSentence(fix.talker.empty() ? "GP" : fix.talker, "GGA", fields);
}

std::string encodeRmc(const FixRecord &fix) {
    std::vector<std::string> fields;
    fields.push_back(fix.time ? formatTime(*fix.time) : std::string());
    fields.push_back(fix.position ? "A" : "V");
    appendPosition(fields, fix.position);
    fields.push_back(fix.speed_mps ? fixed(*fix.speed_mps * kMpsToKnots, 3) : std::string());
    fields.push_back(optionalFixed(fix.course_deg, 2));
    fields.push_back(fix.time ? formatDate(*fix.time) : std::string());
    fields.insert(fields.end(), {"", ""});
    fields.push_back(fix.position ? "A" : "N");
    return encodeSentence(fix.talker.empty() ? "GP" : fix.talker, "RMC", fields);
}

std::string encodeVtg(const FixRecord &fix) {
    std::vector<std::string> fields;
    fields.push_back(optionalFixed(fix.course_deg, 2));
    fields.push_back("T");
    fields.push_back("");
    fields.push_back("M");
    fields.push_back(fix.speed_mps ? fixed(*fix.speed_mps * kMpsToKnots, 3) : std::string());
    fields.push_back("N");
    fields.push_back(fix.speed_mps ? fixed(*fix.speed_mps * kMpsToKmh, 3) : std::string());
    fields.push_back("K");
    fields.push_back(fix.speed_mps ? "A" : "N");
    return encodeSentence(fix.talker.empty() ? "GP" : fix.talker, "VTG", fields);
}

//------------------------- Rover position report -------------------------
std::string formatGgaForPosition(const GeodeticCoordinate &position, const UtcTime &time) {
    std::vector<std::string> fields;
    fields.push_back(formatTime(time));
    appendPosition(fields, position);
    fields.insert(fields.end(), {"1", "10", "1"});
    fields.push_back(fixed(position.altitude(), 2));
    fields.push_back("M");
    fields.insert(fields.end(), {"", "", "0.0", "0000"});
    return encodeSentence("GP", "GGA", fields);
}

std::string formatGgaForPosition(const GeodeticCoordinate &position) {
    return formatGgaForPosition(position, utcNow());
}

UtcTime utcNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            now.time_since_epoch()).count() % 1000000;
    std::tm tm{};
    gmtime_r(&secs, &tm);

    UtcTime out;
    out.hour = tm.tm_hour;
    out.minute = tm.tm_min;
    out.second = tm.tm_sec + static_cast<double>(micros) / 1e6;
    out.year = tm.tm_year + 1900;
    out.month = tm.tm_mon + 1;
    out.day = tm.tm_mday;
    return out;
}

} // namespace gnss_rtk_bridge
