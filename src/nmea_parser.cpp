#include "gnss_rtk_bridge/nmea_parser.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <unordered_map>

namespace gnss_rtk_bridge {

namespace {

using Fields = std::vector<std::string>;
using Extractor = NmeaPayload (*)(const Fields &);

//------------------------- Field helpers -------------------------
const std::string &fieldAt(const Fields &f, std::size_t i) {
    static const std::string empty;
    return i < f.size() ? f[i] : empty;
}

void requireFields(const Fields &f, std::size_t count, const char *type) {
    if (f.size() < count) {
        throw ParseError(std::string(type) + ": expected at least " + std::to_string(count) +
                         " fields, got " + std::to_string(f.size()));
    }
}

std::optional<double> optionalDouble(const Fields &f, std::size_t i) {
    const std::string &s = fieldAt(f, i);
    if (s.empty()) return std::nullopt;
    char *end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) {
        throw ParseError("not a number: '" + s + "'");
    }
    return v;
}

std::optional<int> optionalInt(const Fields &f, std::size_t i) {
    const std::string &s = fieldAt(f, i);
    if (s.empty()) return std::nullopt;
    char *end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end != s.c_str() + s.size()) {
        throw ParseError("not an integer: '" + s + "'");
    }
    return static_cast<int>(v);
}

char optionalChar(const Fields &f, std::size_t i) {
    const std::string &s = fieldAt(f, i);
    return s.empty() ? '\0' : s[0];
}

bool allDigits(const std::string &s, std::size_t from, std::size_t to) {
    for (std::size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// hhmmss[.sss]
std::optional<UtcTime> optionalTime(const Fields &f, std::size_t i) {
    const std::string &s = fieldAt(f, i);
    if (s.empty()) return std::nullopt;
    if (s.size() < 6 || !allDigits(s, 0, 6)) {
        throw ParseError("invalid UTC time: '" + s + "'");
    }
    UtcTime t;
    t.hour = std::atoi(s.substr(0, 2).c_str());
    t.minute = std::atoi(s.substr(2, 2).c_str());
    char *end = nullptr;
    const std::string sec = s.substr(4);
    t.second = std::strtod(sec.c_str(), &end);
    if (end != sec.c_str() + sec.size() || t.hour > 23 || t.minute > 59 || t.second >= 61.0) {
        throw ParseError("invalid UTC time: '" + s + "'");
    }
    return t;
}

// ddmmyy, as found in RMC
void applyDate(const std::string &s, UtcTime &t) {
    if (s.size() != 6 || !allDigits(s, 0, 6)) {
        throw ParseError("invalid date: '" + s + "'");
    }
    const int day = std::atoi(s.substr(0, 2).c_str());
    const int month = std::atoi(s.substr(2, 2).c_str());
    const int yy = std::atoi(s.substr(4, 2).c_str());
    if (day < 1 || day > 31 || month < 1 || month > 12) {
        throw ParseError("invalid date: '" + s + "'");
    }
    t.day = day;
    t.month = month;
    t.year = yy < 80 ? 2000 + yy : 1900 + yy;
}

std::optional<HorizontalPosition> optionalPosition(const Fields &f, std::size_t lat_index) {
    const std::string &lat = fieldAt(f, lat_index);
    const std::string &lat_hemi = fieldAt(f, lat_index + 1);
    const std::string &lon = fieldAt(f, lat_index + 2);
    const std::string &lon_hemi = fieldAt(f, lat_index + 3);
    if (lat.empty() || lon.empty()) return std::nullopt;

    HorizontalPosition pos;
    if (lat_hemi.size() != 1 || (lat_hemi[0] != 'N' && lat_hemi[0] != 'S') ||
        !NmeaParser::nmeaToDeg(lat, lat_hemi[0], pos.latitude) || std::fabs(pos.latitude) > 90.0) {
        throw ParseError("invalid latitude: '" + lat + "," + lat_hemi + "'");
    }
    if (lon_hemi.size() != 1 || (lon_hemi[0] != 'E' && lon_hemi[0] != 'W') ||
        !NmeaParser::nmeaToDeg(lon, lon_hemi[0], pos.longitude) || std::fabs(pos.longitude) > 180.0) {
        throw ParseError("invalid longitude: '" + lon + "," + lon_hemi + "'");
    }
    return pos;
}

//------------------------- Extractors -------------------------
NmeaPayload extractGGA(const Fields &f) {
    // time,lat,NS,lon,EW,quality,numSV,HDOP,alt,M,sep,M,diffAge,diffStation
    requireFields(f, 14, "GGA");
    GgaData d;
    d.time = optionalTime(f, 0);
    d.position = optionalPosition(f, 1);
    const std::optional<int> quality = optionalInt(f, 5);
    d.quality = quality ? fixQualityFromGga(*quality) : FixQuality::NoFix;
    d.satellites = optionalInt(f, 6);
    d.hdop = optionalDouble(f, 7);
    d.altitude_msl_m = optionalDouble(f, 8);
    d.geoid_separation_m = optionalDouble(f, 10);
    d.correction_age_s = optionalDouble(f, 12);
    d.station_id = fieldAt(f, 13);
    return d;
}

NmeaPayload extractRMC(const Fields &f) {
    // time,status,lat,NS,lon,EW,speed,course,date,magvar,EW[,mode]
    requireFields(f, 11, "RMC");
    RmcData d;
    d.time = optionalTime(f, 0);
    const char status = optionalChar(f, 1);
    if (status != 'A' && status != 'V') {
        throw ParseError(std::string("RMC: invalid status '") + fieldAt(f, 1) + "'");
    }
    d.valid = status == 'A';
    d.position = optionalPosition(f, 2);
    d.speed_knots = optionalDouble(f, 6);
    d.course_deg = optionalDouble(f, 7);
    if (!fieldAt(f, 8).empty()) {
        UtcTime dated = d.time.value_or(UtcTime{});
        applyDate(fieldAt(f, 8), dated);
        if (d.time) d.time = dated;
    }
    d.magnetic_variation_deg = optionalDouble(f, 9);
    if (d.magnetic_variation_deg && optionalChar(f, 10) == 'W') {
        d.magnetic_variation_deg = -*d.magnetic_variation_deg;
    }
    d.mode = optionalChar(f, 11);
    return d;
}

NmeaPayload extractGSA(const Fields &f) {
    // mode,fixType,prn1..prn12,PDOP,HDOP,VDOP[,systemId]
    requireFields(f, 17, "GSA");
    GsaData d;
    d.selection_mode = optionalChar(f, 0);
    d.fix_type = optionalInt(f, 1).value_or(1);
    for (std::size_t i = 2; i < 14; ++i) {
        if (const std::optional<int> prn = optionalInt(f, i)) d.prns.push_back(*prn);
    }
    d.pdop = optionalDouble(f, 14);
    d.hdop = optionalDouble(f, 15);
    d.vdop = optionalDouble(f, 16);
    d.system_id = optionalInt(f, 17);
    return d;
}

NmeaPayload extractGSV(const Fields &f) {
    // numMsg,msgNum,numSV,{prn,elev,azim,snr}*[,signalId]
    requireFields(f, 3, "GSV");
    GsvData d;
    d.total_messages = optionalInt(f, 0).value_or(0);
    d.message_number = optionalInt(f, 1).value_or(0);
    d.satellites_in_view = optionalInt(f, 2).value_or(0);
    for (std::size_t i = 3; i + 4 <= f.size(); i += 4) {
        const std::optional<int> prn = optionalInt(f, i);
        if (!prn) continue;
        SatelliteInView sat;
        sat.prn = *prn;
        sat.elevation_deg = optionalInt(f, i + 1);
        sat.azimuth_deg = optionalInt(f, i + 2);
        sat.snr_dbhz = optionalInt(f, i + 3);
        d.satellites.push_back(sat);
    }
    return d;
}

NmeaPayload extractVTG(const Fields &f) {
    // courseT,T,courseM,M,speedN,N,speedK,K[,mode]
    requireFields(f, 8, "VTG");
    VtgData d;
    d.course_true_deg = optionalDouble(f, 0);
    d.course_magnetic_deg = optionalDouble(f, 2);
    d.speed_knots = optionalDouble(f, 4);
    d.speed_kmh = optionalDouble(f, 6);
    d.mode = optionalChar(f, 8);
    return d;
}

NmeaPayload extractGLL(const Fields &f) {
    // lat,NS,lon,EW,time,status[,mode]
    requireFields(f, 6, "GLL");
    GllData d;
    d.position = optionalPosition(f, 0);
    d.time = optionalTime(f, 4);
    d.valid = optionalChar(f, 5) == 'A';
    return d;
}

NmeaPayload extractZDA(const Fields &f) {
    // time,day,month,year,zoneHours,zoneMinutes
    requireFields(f, 4, "ZDA");
    ZdaData d;
    const std::optional<UtcTime> time = optionalTime(f, 0);
    if (!time) throw ParseError("ZDA: missing time");
    d.time = *time;
    d.time.day = optionalInt(f, 1);
    d.time.month = optionalInt(f, 2);
    d.time.year = optionalInt(f, 3);
    d.zone_hours = optionalInt(f, 4);
    d.zone_minutes = optionalInt(f, 5);
    return d;
}

const std::unordered_map<std::string, Extractor> &extractors() {
    static const std::unordered_map<std::string, Extractor> table = {
        {"GGA", &extractGGA},
        {"RMC", &extractRMC},
        {"GSA", &extractGSA},
        {"GSV", &extractGSV},
        {"VTG", &extractVTG},
        {"GLL", &extractGLL},
        {"ZDA", &extractZDA},
    };
    return table;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// Framing, checksum and address field. Fills everything except `data`.
NmeaSentence frame(const std::string &raw) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    if (line.empty() || (line[0] != '$' && line[0] != '!')) {
        throw ParseError("sentence does not start with '$' or '!'");
    }

    const std::size_t star = line.find('*');
    if (star == std::string::npos) {
        throw ParseError("missing checksum delimiter");
    }
    if (line.find('*', star + 1) != std::string::npos) {
        throw ParseError("more than one checksum delimiter");
    }
    if (line.size() != star + 3) {
        throw ParseError("checksum must be exactly two hex digits");
    }
    const int hi = hexDigit(line[star + 1]);
    const int lo = hexDigit(line[star + 2]);
    if (hi < 0 || lo < 0) {
        throw ParseError("checksum is not hexadecimal");
    }

    const std::string body = line.substr(1, star - 1);
    const uint8_t expected = static_cast<uint8_t>((hi << 4) | lo);
    const uint8_t actual = NmeaParser::checksum(body);
    if (expected != actual) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "checksum mismatch: got %02X, computed %02X", expected, actual);
        throw ChecksumError(msg);
    }

    std::vector<std::string> parts;
    NmeaParser::splitCSV(body, parts);
    const std::string &address = parts.front();

    NmeaSentence sentence;
    sentence.marker = line[0];
    if (!address.empty() && address[0] == 'P') {
        sentence.talker = "P";
        sentence.type = address.substr(1);
    } else if (address.size() == 5) {
        sentence.talker = address.substr(0, 2);
        sentence.type = address.substr(2, 3);
    } else {
        throw ParseError("invalid address field: '" + address + "'");
    }
    sentence.fields.assign(parts.begin() + 1, parts.end());
    return sentence;
}

void extract(NmeaSentence &sentence) {
    const auto &table = extractors();
    const auto it = table.find(sentence.type);
    if (it == table.end()) {
        sentence.data = NmeaUnknownSentence{};
        return;
    }
    sentence.data = it->second(sentence.fields);
}

} // namespace

//------------------------- Fix quality -------------------------
FixQuality fixQualityFromGga(int indicator) {
    switch (indicator) {
        case 0: return FixQuality::NoFix;
        case 1: return FixQuality::Gps;
        case 2: return FixQuality::Dgps;
        case 3: return FixQuality::Gps;  // PPS
        case 4: return FixQuality::RtkFixed;
        case 5: return FixQuality::RtkFloat;
        case 6: return FixQuality::DeadReckoning;
        case 7:                          // manual input
        case 8: return FixQuality::NoFix;  // simulator
        default:
            throw ParseError("unknown GGA fix quality " + std::to_string(indicator));
    }
}

int fixQualityToGga(FixQuality quality) {
    switch (quality) {
        case FixQuality::NoFix: return 0;
        case FixQuality::Gps: return 1;
        case FixQuality::Dgps: return 2;
        case FixQuality::RtkFixed: return 4;
        case FixQuality::RtkFloat: return 5;
        case FixQuality::DeadReckoning: return 6;
    }
    return 0;
}

const char *toString(FixQuality quality) {
    switch (quality) {
        case FixQuality::NoFix: return "no-fix";
        case FixQuality::Gps: return "gps";
        case FixQuality::Dgps: return "dgps";
        case FixQuality::RtkFixed: return "rtk-fixed";
        case FixQuality::RtkFloat: return "rtk-float";
        case FixQuality::DeadReckoning: return "dead-reckoning";
    }
    return "unknown";
}

std::optional<double> GgaData::ellipsoidalHeight() const {
    if (!altitude_msl_m) return std::nullopt;
    return *altitude_msl_m + geoid_separation_m.value_or(0.0);
}

//------------------------- Helper CSV Split -------------------------
// Keeps empty fields, including trailing ones ("a,,b," -> 4 fields).
int NmeaParser::splitCSV(const std::string &s, std::vector<std::string> &out) {
    out.clear();
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = s.find(',', start);
        if (comma == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, comma - start));
        start = comma + 1;
    }
    return static_cast<int>(out.size());
}

//------------------------- NMEA → Degrees -------------------------
bool NmeaParser::nmeaToDeg(const std::string &field, char hemi, double &deg_out) {
    if (field.size() < 4) return false;
    const size_t dot = field.find('.');
    const size_t deg_len = (dot != std::string::npos ? (dot >= 4 ? dot - 2 : 0) : field.size() - 2);
    if (deg_len < 2 || deg_len > 3) return false;
    if (!allDigits(field, 0, deg_len)) return false;

    const std::string min_str = field.substr(deg_len);
    char *end = nullptr;
    const double min = std::strtod(min_str.c_str(), &end);
    if (end != min_str.c_str() + min_str.size() || min < 0.0 || min >= 60.0) return false;

    deg_out = std::atoi(field.substr(0, deg_len).c_str()) + min / 60.0;
    if (hemi == 'S' || hemi == 'W') deg_out = -deg_out;
    return true;
}

uint8_t NmeaParser::checksum(const std::string &body) {
    uint8_t cs = 0;
    for (char c : body) cs ^= static_cast<uint8_t>(c);
    return cs;
}

//------------------------- Parse -------------------------
NmeaSentence NmeaParser::parse(const std::string &line) {
    NmeaSentence sentence = frame(line);
    extract(sentence);
    return sentence;
}

NmeaLineResult NmeaParser::decodeLine(const std::string &line) {
    NmeaLineResult result;
    NmeaSentence sentence;
    try {
        sentence = frame(line);
    } catch (const ChecksumError &ex) {
        result.error = NmeaErrorKind::Checksum;
        result.message = ex.what();
        return result;
    } catch (const ParseError &ex) {
        result.error = NmeaErrorKind::Framing;
        result.message = ex.what();
        return result;
    }

    try {
        extract(sentence);
    } catch (const ParseError &ex) {
        result.error = NmeaErrorKind::Field;
        result.message = sentence.type + ": " + ex.what();
        return result;
    }
    result.sentence = std::move(sentence);
    return result;
}

//------------------------- Line splitter -------------------------
std::vector<std::string> NmeaLineSplitter::feed(const char *data, std::size_t size) {
    std::vector<std::string> lines;
    for (std::size_t i = 0; i < size; ++i) {
        const char c = data[i];
        if (c == '\n') {
            if (!discarding_) {
                if (!buffer_.empty() && buffer_.back() == '\r') buffer_.pop_back();
                if (!buffer_.empty()) lines.push_back(buffer_);
            }
            buffer_.clear();
            discarding_ = false;
            continue;
        }
        if (discarding_) continue;

        buffer_.push_back(c);
        if (buffer_.size() > kMaxSentenceLength) {
            buffer_.clear();
            discarding_ = true;
            ++overflows_;
        }
    }
    return lines;
}

void NmeaLineSplitter::reset() {
    buffer_.clear();
    discarding_ = false;
}

} // namespace gnss_rtk_bridge
