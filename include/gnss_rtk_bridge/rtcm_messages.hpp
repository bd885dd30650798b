#pragma once

#include "gnss_rtk_bridge/geodesy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gnss_rtk_bridge {

//------------------------- 1005 / 1006 -------------------------
struct RtcmStationPosition {
    uint16_t station_id = 0;
    uint8_t itrf_year = 0;
    bool gps = false;
    bool glonass = false;
    bool galileo = false;
    bool reference_station = false;
    bool single_receiver_oscillator = false;
    uint8_t quarter_cycle = 0;
    EcefCoordinate position;                // antenna reference point, meters
    std::optional<double> antenna_height_m; // 1006 only
};

//------------------------- 1007 / 1008 / 1033 -------------------------
struct RtcmAntennaDescriptor {
    uint16_t station_id = 0;
    std::string descriptor;
    uint8_t setup_id = 0;
    std::string antenna_serial;  // 1008, 1033
    std::string receiver_type;   // 1033
    std::string firmware_version;
    std::string receiver_serial;
};

//------------------------- MSM4 - MSM7 -------------------------
// Fields RTCM marks as invalid (most negative value, all ones) stay unset.
struct RtcmMsmSignal {
    int signal_id = 0;                               // 1-based index into the signal mask
    std::optional<double> fine_pseudorange_ms;
    std::optional<double> fine_phaserange_ms;
    uint16_t lock_time_indicator = 0;
    bool half_cycle_ambiguity = false;
    double cnr_dbhz = 0.0;
    std::optional<double> fine_phaserange_rate_mps;  // MSM5, MSM7
};

struct RtcmMsmSatellite {
    int svid = 0;
    std::string id;                                  // "G05", "E11", ...
    std::optional<double> rough_range_ms;
    std::optional<int> extended_info;                // MSM5, MSM7
    std::optional<int> rough_phaserange_rate_mps;    // MSM5, MSM7
    std::vector<RtcmMsmSignal> signals;
    std::optional<double> cnr_dbhz;                  // best signal
};

struct RtcmMsmObservation {
    int msm_level = 0;      // 4..7
    char system = 'G';      // G, R, E, J, C
    uint16_t station_id = 0;
    uint32_t epoch_time_ms = 0;
    bool multiple_message = false;
    uint8_t iods = 0;
    uint8_t clock_steering = 0;
    uint8_t external_clock = 0;
    bool smoothing = false;
    uint8_t smoothing_interval = 0;
    std::vector<RtcmMsmSatellite> satellites;
};

// Valid frame of a type without a decoder. The payload is on the message.
struct RtcmOpaquePayload {};

using RtcmBody = std::variant<RtcmOpaquePayload, RtcmStationPosition, RtcmAntennaDescriptor,
                              RtcmMsmObservation>;

struct RtcmMessage {
    uint16_t type = 0;
    std::size_t bit_length = 0;  // payload bits
    std::vector<uint8_t> frame;  // preamble through CRC
    RtcmBody body;

    const uint8_t *payload() const { return frame.data() + 3; }
    std::size_t payloadSize() const { return frame.size() - 6; }
};

/// Decodes a CRC-checked payload. Throws FieldBoundsError when a field runs
/// past the payload.
RtcmBody decodeRtcm3Payload(uint16_t type, const uint8_t *payload, std::size_t size);

bool isMsmType(uint16_t type);

} // namespace gnss_rtk_bridge
