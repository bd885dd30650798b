#include "gnss_rtk_bridge/fix_record.hpp"

#include <cmath>
#include <sstream>

namespace gnss_rtk_bridge {

namespace {

constexpr double kKnotsToMps = 0.514444;
constexpr double kKmhToMps = 1.0 / 3.6;
constexpr double kDegreeTolerance = 1e-9;
constexpr double kValueTolerance = 1e-6;

std::string describe(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}
std::string describe(int v) { return std::to_string(v); }
std::string describe(FixQuality v) { return toString(v); }

bool same(double a, double b) { return std::fabs(a - b) <= kValueTolerance; }
bool same(int a, int b) { return a == b; }
bool same(FixQuality a, FixQuality b) { return a == b; }

template <typename T>
void mergeField(std::optional<T> &dst, const std::optional<T> &src, const char *name,
                const std::string &sentence_type, std::vector<FieldConflict> &conflicts) {
    if (!src) return;
    if (!dst) {
        dst = src;
    } else if (!same(*dst, *src)) {
        conflicts.push_back(FieldConflict{name, sentence_type, describe(*src)});
    }
}

void mergeTime(FixRecord &record, const UtcTime &time, const std::string &sentence_type) {
    if (!record.time) {
        record.time = time;
        return;
    }
    UtcTime &t = *record.time;
    if (!t.sameTimeOfDay(time)) {
        record.conflicts.push_back(FieldConflict{"time", sentence_type, describe(time.second)});
        return;
    }
    if (!t.year && time.year) {
        t.year = time.year;
        t.month = time.month;
        t.day = time.day;
    }
}

void mergePosition(FixRecord &record, const FixRecord &update, const std::string &sentence_type) {
    if (!update.position) return;
    const GeodeticCoordinate &incoming = *update.position;
    if (!record.position) {
        record.position = incoming;
        record.position_has_altitude = update.position_has_altitude;
        record.position_source = sentence_type;
        return;
    }

    const GeodeticCoordinate &held = *record.position;
    const bool same_horizontal =
        std::fabs(held.latitude() - incoming.latitude()) <= kDegreeTolerance &&
        std::fabs(held.longitude() - incoming.longitude()) <= kDegreeTolerance;

    if (same_horizontal) {
        if (!update.position_has_altitude) return;
        if (!record.position_has_altitude) {
            record.position = GeodeticCoordinate(held.latitude(), held.longitude(), incoming.altitude());
            record.position_has_altitude = true;
            return;
        }
        if (same(held.altitude(), incoming.altitude())) return;
    }
    record.conflicting_positions.push_back(
        PositionReport{sentence_type, incoming, update.position_has_altitude});
}

std::optional<GeodeticCoordinate> toGeodetic(const std::optional<HorizontalPosition> &pos,
                                             std::optional<double> altitude = std::nullopt) {
    if (!pos) return std::nullopt;
    return GeodeticCoordinate(pos->latitude, pos->longitude, altitude.value_or(0.0));
}

} // namespace

//------------------------- Single sentence -------------------------
FixRecord fixFromSentence(const NmeaSentence &sentence) {
    FixRecord fix;
    fix.talker = sentence.talker;

    if (const auto *gga = std::get_if<GgaData>(&sentence.data)) {
        fix.time = gga->time;
        const std::optional<double> height = gga->ellipsoidalHeight();
        fix.position = toGeodetic(gga->position, height);
        fix.position_has_altitude = fix.position.has_value() && height.has_value();
        fix.quality = gga->quality;
        fix.satellites = gga->satellites;
        fix.hdop = gga->hdop;
    } else if (const auto *rmc = std::get_if<RmcData>(&sentence.data)) {
        fix.time = rmc->time;
        if (rmc->valid) {
            fix.position = toGeodetic(rmc->position);
            if (rmc->speed_knots) fix.speed_mps = *rmc->speed_knots * kKnotsToMps;
            fix.course_deg = rmc->course_deg;
        }
    } else if (const auto *gsa = std::get_if<GsaData>(&sentence.data)) {
        fix.pdop = gsa->pdop;
        fix.hdop = gsa->hdop;
        fix.vdop = gsa->vdop;
    } else if (const auto *vtg = std::get_if<VtgData>(&sentence.data)) {
        fix.course_deg = vtg->course_true_deg;
        if (vtg->speed_knots) fix.speed_mps = *vtg->speed_knots * kKnotsToMps;
        else if (vtg->speed_kmh) fix.speed_mps = *vtg->speed_kmh * kKmhToMps;
    } else if (const auto *gll = std::get_if<GllData>(&sentence.data)) {
        fix.time = gll->time;
        if (gll->valid) fix.position = toGeodetic(gll->position);
    } else if (const auto *zda = std::get_if<ZdaData>(&sentence.data)) {
        fix.time = zda->time;
    }

    if (fix.position) fix.position_source = sentence.type;
    return fix;
}

void mergeFix(FixRecord &record, const FixRecord &update, const std::string &sentence_type) {
    if (update.time) mergeTime(record, *update.time, sentence_type);
    mergePosition(record, update, sentence_type);
    mergeField(record.quality, update.quality, "quality", sentence_type, record.conflicts);
    mergeField(record.hdop, update.hdop, "hdop", sentence_type, record.conflicts);
    mergeField(record.vdop, update.vdop, "vdop", sentence_type, record.conflicts);
    mergeField(record.pdop, update.pdop, "pdop", sentence_type, record.conflicts);
    mergeField(record.satellites, update.satellites, "satellites", sentence_type, record.conflicts);
    mergeField(record.speed_mps, update.speed_mps, "speed", sentence_type, record.conflicts);
    mergeField(record.course_deg, update.course_deg, "course", sentence_type, record.conflicts);
}

//------------------------- Accumulator -------------------------
std::optional<FixRecord> FixAccumulator::add(const NmeaSentence &sentence) {
    const FixRecord update = fixFromSentence(sentence);
    std::optional<FixRecord> completed;

    auto it = records_.find(sentence.talker);
    if (it != records_.end() && update.time && it->second.time &&
        !it->second.time->sameTimeOfDay(*update.time)) {
        completed = std::move(it->second);
        records_.erase(it);
        it = records_.end();
    }
    if (it == records_.end()) {
        FixRecord fresh;
        fresh.talker = sentence.talker;
        it = records_.emplace(sentence.talker, std::move(fresh)).first;
    }

    mergeFix(it->second, update, sentence.type);
    return completed;
}

const FixRecord *FixAccumulator::current(const std::string &talker) const {
    const auto it = records_.find(talker);
    return it == records_.end() ? nullptr : &it->second;
}

std::optional<FixRecord> FixAccumulator::take(const std::string &talker) {
    const auto it = records_.find(talker);
    if (it == records_.end()) return std::nullopt;
    FixRecord out = std::move(it->second);
    records_.erase(it);
    return out;
}

} // namespace gnss_rtk_bridge
