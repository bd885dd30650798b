#pragma once

#include "gnss_rtk_bridge/geodesy.hpp"
#include "gnss_rtk_bridge/nmea_parser.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gnss_rtk_bridge {

struct PositionReport {
    std::string sentence_type;
    GeodeticCoordinate position;
    bool has_altitude = false;
};

struct FieldConflict {
    std::string field;
    std::string sentence_type;
    std::string rejected_value;
};

/// Fix state for one talker and one fix cycle. Fields that no sentence has
/// reported yet stay unset.
struct FixRecord {
    std::string talker;
    std::optional<UtcTime> time;
    std::optional<GeodeticCoordinate> position;
    bool position_has_altitude = false;  // false for RMC/GLL-only positions
    std::string position_source;
    std::optional<FixQuality> quality;
    std::optional<double> hdop;
    std::optional<double> vdop;
    std::optional<double> pdop;
    std::optional<int> satellites;
    std::optional<double> speed_mps;
    std::optional<double> course_deg;

    // Positions from other sentences of the same cycle that disagree with
    // `position`. Which one to trust is left to the caller.
    std::vector<PositionReport> conflicting_positions;
    std::vector<FieldConflict> conflicts;

    FixQuality fixQuality() const { return quality.value_or(FixQuality::NoFix); }
};

/// Record holding only what `sentence` itself reports.
FixRecord fixFromSentence(const NmeaSentence &sentence);

/// Folds `update` into `record` without overwriting already-set values.
/// Disagreements end up in `conflicting_positions` / `conflicts`.
void mergeFix(FixRecord &record, const FixRecord &update, const std::string &sentence_type);

/// Accumulates sentences into one FixRecord per talker. A sentence carrying a
/// different UTC time than the current record starts a new fix cycle.
class FixAccumulator {
public:
    // Returns the completed record of the previous cycle, if `sentence`
    // started a new one.
    std::optional<FixRecord> add(const NmeaSentence &sentence);

    const FixRecord *current(const std::string &talker) const;
    std::optional<FixRecord> take(const std::string &talker);
    void reset() { records_.clear(); }

private:
    std::map<std::string, FixRecord> records_;
};

} // namespace gnss_rtk_bridge
