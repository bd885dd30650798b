#include "gnss_rtk_bridge/rtcm_messages.hpp"
#include "gnss_rtk_bridge/bit_cursor.hpp"
#include "gnss_rtk_bridge/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <unordered_map>

namespace gnss_rtk_bridge {

namespace {

using Decoder = RtcmBody (*)(uint16_t type, BitCursor &bits);

constexpr double kAntennaResolution = 1e-4;  // meters
constexpr double kRoughRangeModResolution = 1.0 / 1024.0;  // ms
constexpr double kFineRateResolution = 1e-4;  // m/s
constexpr double kHighResCnrResolution = 0.0625;  // dB-Hz
constexpr unsigned kMaxCells = 64;

// Invalid marker of an n-bit two's complement field: only the sign bit set.
bool isInvalid(int64_t value, unsigned bits) {
    return value == -(int64_t{1} << (bits - 1));
}

std::optional<double> readFine(BitCursor &bits, unsigned width, double scale) {
    const int64_t raw = bits.readSigned(width);
    if (isInvalid(raw, width)) return std::nullopt;
    return static_cast<double>(raw) * scale;
}

//------------------------- Station position -------------------------
RtcmBody decodeStationPosition(uint16_t type, BitCursor &bits) {
    RtcmStationPosition out;
    out.station_id = static_cast<uint16_t>(bits.readUnsigned(12));
    out.itrf_year = static_cast<uint8_t>(bits.readUnsigned(6));
    out.gps = bits.readBool();
    out.glonass = bits.readBool();
    out.galileo = bits.readBool();
    out.reference_station = bits.readBool();
    out.position.x = bits.readScaled(38, kAntennaResolution);
    out.single_receiver_oscillator = bits.readBool();
    bits.skip(1);  // reserved
    out.position.y = bits.readScaled(38, kAntennaResolution);
    out.quarter_cycle = static_cast<uint8_t>(bits.readUnsigned(2));
    out.position.z = bits.readScaled(38, kAntennaResolution);
    if (type == 1006) {
        out.antenna_height_m = bits.readScaledUnsigned(16, kAntennaResolution);
    }
    return out;
}

//------------------------- Antenna / receiver descriptors -------------------------
RtcmBody decodeAntennaDescriptor(uint16_t type, BitCursor &bits) {
    RtcmAntennaDescriptor out;
    out.station_id = static_cast<uint16_t>(bits.readUnsigned(12));
    out.descriptor = bits.readString();
    out.setup_id = static_cast<uint8_t>(bits.readUnsigned(8));
    if (type == 1008 || type == 1033) {
        out.antenna_serial = bits.readString();
    }
    if (type == 1033) {
        out.receiver_type = bits.readString();
        out.firmware_version = bits.readString();
        out.receiver_serial = bits.readString();
    }
    return out;
}

//------------------------- MSM -------------------------
char msmSystem(uint16_t type) {
    if (type < 1080) return 'G';
    if (type < 1090) return 'R';
    if (type < 1100) return 'E';
    if (type < 1120) return 'J';
    return 'C';
}

void readSatelliteData(BitCursor &bits, std::vector<RtcmMsmSatellite> &sats, bool extended) {
    std::vector<uint64_t> whole_ms(sats.size());
    for (auto &ms : whole_ms) ms = bits.readUnsigned(8);
    if (extended) {
        for (auto &sat : sats) sat.extended_info = static_cast<int>(bits.readUnsigned(4));
    }
    for (std::size_t i = 0; i < sats.size(); ++i) {
        const uint64_t mod_ms = bits.readUnsigned(10);
        if (whole_ms[i] != 0xFF) {
            sats[i].rough_range_ms = static_cast<double>(whole_ms[i]) +
                                     static_cast<double>(mod_ms) * kRoughRangeModResolution;
        }
    }
    if (extended) {
        for (auto &sat : sats) {
            const int64_t rate = bits.readSigned(14);
            if (!isInvalid(rate, 14)) sat.rough_phaserange_rate_mps = static_cast<int>(rate);
        }
    }
}

void readSignalData(BitCursor &bits, std::vector<RtcmMsmSignal *> &cells, int level) {
    const bool high_res = level == 6 || level == 7;
    const unsigned pr_bits = high_res ? 20 : 15;
    const unsigned cp_bits = high_res ? 24 : 22;
    const double pr_scale = std::ldexp(1.0, high_res ? -29 : -24);
    const double cp_scale = std::ldexp(1.0, high_res ? -31 : -29);

    for (auto *cell : cells) cell->fine_pseudorange_ms = readFine(bits, pr_bits, pr_scale);
    for (auto *cell : cells) cell->fine_phaserange_ms = readFine(bits, cp_bits, cp_scale);
    for (auto *cell : cells) {
        cell->lock_time_indicator = static_cast<uint16_t>(bits.readUnsigned(high_res ? 10 : 4));
    }
    for (auto *cell : cells) cell->half_cycle_ambiguity = bits.readBool();
    for (auto *cell : cells) {
        cell->cnr_dbhz = high_res ? bits.readScaledUnsigned(10, kHighResCnrResolution)
                                  : static_cast<double>(bits.readUnsigned(6));
    }
    if (level == 5 || level == 7) {
        for (auto *cell : cells) {
            cell->fine_phaserange_rate_mps = readFine(bits, 15, kFineRateResolution);
        }
    }
}

RtcmBody decodeMsm(uint16_t type, BitCursor &bits) {
    RtcmMsmObservation out;
    out.msm_level = type % 10;
    out.system = msmSystem(type);
    out.station_id = static_cast<uint16_t>(bits.readUnsigned(12));
    out.epoch_time_ms = static_cast<uint32_t>(bits.readUnsigned(30));
    out.multiple_message = bits.readBool();
    out.iods = static_cast<uint8_t>(bits.readUnsigned(3));
    bits.skip(7);  // reserved
    out.clock_steering = static_cast<uint8_t>(bits.readUnsigned(2));
    out.external_clock = static_cast<uint8_t>(bits.readUnsigned(2));
    out.smoothing = bits.readBool();
    out.smoothing_interval = static_cast<uint8_t>(bits.readUnsigned(3));

    const uint64_t sat_mask = bits.readUnsigned(64);
    const uint64_t sig_mask = bits.readUnsigned(32);

    std::vector<int> signal_ids;
    for (int i = 0; i < 32; ++i) {
        if (sig_mask & (uint64_t{1} << (31 - i))) signal_ids.push_back(i + 1);
    }
    for (int i = 0; i < 64; ++i) {
        if (!(sat_mask & (uint64_t{1} << (63 - i)))) continue;
        RtcmMsmSatellite sat;
        sat.svid = i + 1;
        char id[8];
        std::snprintf(id, sizeof(id), "%c%02d", out.system, sat.svid);
        sat.id = id;
        out.satellites.push_back(std::move(sat));
    }

    const std::size_t cell_count = out.satellites.size() * signal_ids.size();
    if (cell_count > kMaxCells) {
        throw ParseError("MSM cell mask of " + std::to_string(cell_count) + " cells exceeds 64");
    }
    const uint64_t cell_mask = bits.readUnsigned(static_cast<unsigned>(cell_count));

    // Signals are added to each satellite before any pointer into them is taken.
    std::size_t cell = 0;
    for (auto &sat : out.satellites) {
        for (int signal_id : signal_ids) {
            if (cell_mask & (uint64_t{1} << (cell_count - 1 - cell))) {
                RtcmMsmSignal sig;
                sig.signal_id = signal_id;
                sat.signals.push_back(sig);
            }
            ++cell;
        }
    }
    std::vector<RtcmMsmSignal *> cells;
    for (auto &sat : out.satellites) {
        for (auto &sig : sat.signals) cells.push_back(&sig);
    }

    const bool extended = out.msm_level == 5 || out.msm_level == 7;
    readSatelliteData(bits, out.satellites, extended);
    readSignalData(bits, cells, out.msm_level);

    for (auto &sat : out.satellites) {
        if (sat.signals.empty()) continue;
        const auto best = std::max_element(
            sat.signals.begin(), sat.signals.end(),
            [](const RtcmMsmSignal &a, const RtcmMsmSignal &b) { return a.cnr_dbhz < b.cnr_dbhz; });
        sat.cnr_dbhz = best->cnr_dbhz;
    }
    return out;
}

//------------------------- Type table -------------------------
const std::unordered_map<uint16_t, Decoder> &decoderTable() {
    static const std::unordered_map<uint16_t, Decoder> table = [] {
        std::unordered_map<uint16_t, Decoder> t{
            {1005, &decodeStationPosition},
            {1006, &decodeStationPosition},
            {1007, &decodeAntennaDescriptor},
            {1008, &decodeAntennaDescriptor},
            {1033, &decodeAntennaDescriptor},
        };
        for (uint16_t base : {1070, 1080, 1090, 1110, 1120}) {
            for (uint16_t level = 4; level <= 7; ++level) {
                t.emplace(static_cast<uint16_t>(base + level), &decodeMsm);
            }
        }
        return t;
    }();
    return table;
}

} // namespace

bool isMsmType(uint16_t type) {
    const auto &table = decoderTable();
    const auto it = table.find(type);
    return it != table.end() && it->second == &decodeMsm;
}

RtcmBody decodeRtcm3Payload(uint16_t type, const uint8_t *payload, std::size_t size) {
    const auto &table = decoderTable();
    const auto it = table.find(type);
    if (it == table.end()) return RtcmOpaquePayload{};

    BitCursor bits(payload, size);
    bits.skip(12);  // message number
    return it->second(type, bits);
}

} // namespace gnss_rtk_bridge
