#pragma once

#include "gnss_rtk_bridge/geodesy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gnss_rtk_bridge {

enum class FixQuality {
    NoFix,
    Gps,
    Dgps,
    RtkFixed,
    RtkFloat,
    DeadReckoning
};

FixQuality fixQualityFromGga(int indicator);
int fixQualityToGga(FixQuality quality);
const char *toString(FixQuality quality);

struct UtcTime {
    int hour = 0;
    int minute = 0;
    double second = 0.0;
    // Only RMC and ZDA carry a date.
    std::optional<int> year;
    std::optional<int> month;
    std::optional<int> day;

    bool sameTimeOfDay(const UtcTime &other) const {
        return hour == other.hour && minute == other.minute && second == other.second;
    }
};

struct HorizontalPosition {
    double latitude = 0.0;
    double longitude = 0.0;
};

//------------------------- Sentence payloads -------------------------
struct GgaData {
    std::optional<UtcTime> time;
    std::optional<HorizontalPosition> position;
    FixQuality quality = FixQuality::NoFix;
    std::optional<int> satellites;
    std::optional<double> hdop;
    std::optional<double> altitude_msl_m;
    std::optional<double> geoid_separation_m;
    std::optional<double> correction_age_s;
    std::string station_id;

    // Ellipsoidal height, when the sentence carries an altitude.
    std::optional<double> ellipsoidalHeight() const;
};

struct RmcData {
    std::optional<UtcTime> time;
    bool valid = false;
    std::optional<HorizontalPosition> position;
    std::optional<double> speed_knots;
    std::optional<double> course_deg;
    std::optional<double> magnetic_variation_deg;
    char mode = '\0';
};

struct GsaData {
    char selection_mode = '\0';  // M = manual, A = automatic
    int fix_type = 1;            // 1 = none, 2 = 2D, 3 = 3D
    std::vector<int> prns;
    std::optional<double> pdop;
    std::optional<double> hdop;
    std::optional<double> vdop;
    std::optional<int> system_id;
};

struct SatelliteInView {
    int prn = 0;
    std::optional<int> elevation_deg;
    std::optional<int> azimuth_deg;
    std::optional<int> snr_dbhz;
};

struct GsvData {
    int total_messages = 0;
    int message_number = 0;
    int satellites_in_view = 0;
    std::vector<SatelliteInView> satellites;
};

struct VtgData {
    std::optional<double> course_true_deg;
    std::optional<double> course_magnetic_deg;
    std::optional<double> speed_knots;
    std::optional<double> speed_kmh;
    char mode = '\0';
};

struct GllData {
    std::optional<HorizontalPosition> position;
    std::optional<UtcTime> time;
    bool valid = false;
};

struct ZdaData {
    UtcTime time;
    std::optional<int> zone_hours;
    std::optional<int> zone_minutes;
};

// Anything without an extractor; the raw fields stay on the sentence.
struct NmeaUnknownSentence {};

using NmeaPayload = std::variant<NmeaUnknownSentence, GgaData, RmcData, GsaData,
                                 GsvData, VtgData, GllData, ZdaData>;

struct NmeaSentence {
    char marker = '$';
    std::string talker;               // "GP", "GN", ... or "P" for proprietary
    std::string type;                 // "GGA", "RMC", ...
    std::vector<std::string> fields;  // everything after the address field
    NmeaPayload data;
};

enum class NmeaErrorKind {
    None,
    Framing,
    Checksum,
    Field
};

// Outcome of one line. Exactly one of `sentence` and `error` is set.
struct NmeaLineResult {
    std::optional<NmeaSentence> sentence;
    NmeaErrorKind error = NmeaErrorKind::None;
    std::string message;

    bool ok() const { return sentence.has_value(); }
};

class NmeaParser {
public:
    NmeaParser() = default;

    // Throws ParseError (framing, fields) or ChecksumError.
    static NmeaSentence parse(const std::string &line);

    // Never throws for malformed input; each line stands on its own.
    static NmeaLineResult decodeLine(const std::string &line);

    // XOR of every character of `body` (the text between marker and '*').
    static uint8_t checksum(const std::string &body);

    static int splitCSV(const std::string &s, std::vector<std::string> &out);
    static bool nmeaToDeg(const std::string &field, char hemi, double &deg_out);
};

// Cuts a byte stream into NMEA lines. Anything longer than an NMEA sentence
// may be without a line end is dropped and counted.
class NmeaLineSplitter {
public:
    static constexpr std::size_t kMaxSentenceLength = 82;

    std::vector<std::string> feed(const char *data, std::size_t size);
    void reset();

    std::size_t overflows() const { return overflows_; }

private:
    std::string buffer_;
    bool discarding_ = false;
    std::size_t overflows_ = 0;
};

} // namespace gnss_rtk_bridge
