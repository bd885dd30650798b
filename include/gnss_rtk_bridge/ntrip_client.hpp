#pragma once

#include "gnss_rtk_bridge/cancellation.hpp"
#include "gnss_rtk_bridge/geodesy.hpp"
#include "gnss_rtk_bridge/ntrip_config.hpp"
#include "gnss_rtk_bridge/ntrip_session.hpp"
#include "gnss_rtk_bridge/rtcm_decoder.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace gnss_rtk_bridge {

/// Streams RTCM3 corrections from an NTRIP caster and keeps the stream alive
/// across transport failures, timeouts and caster hiccups. Rejected
/// credentials and unknown mountpoints end the run.
///
/// All callbacks run on the thread executing run(), one at a time. Set them
/// before starting the client.
class NtripClient {
public:
    using MessageHandler = Rtcm3Decoder::MessageHandler;
    using StateHandler = std::function<void(NtripState)>;
    using FrameErrorHandler = Rtcm3Decoder::ErrorHandler;

    // Throws std::invalid_argument for an invalid configuration.
    explicit NtripClient(NtripConfig config);
    ~NtripClient();

    NtripClient(const NtripClient &) = delete;
    NtripClient &operator=(const NtripClient &) = delete;

    void setMessageHandler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void setStateHandler(StateHandler handler) { state_handler_ = std::move(handler); }
    void setFrameErrorHandler(FrameErrorHandler handler) { frame_error_handler_ = std::move(handler); }

    // Position reported to the caster as GGA every gga_interval_seconds.
    void setRoverPosition(const GeodeticCoordinate &position);
    void clearRoverPosition();

    /// Blocks until cancel() (returns normally) or a terminal error (thrown:
    /// AuthenticationError, NotFoundError, or the last error once
    /// max_reconnect_attempts is used up).
    void run();

    // Safe from any thread, including before run().
    void cancel() { token_.cancel(); }

    /// Runs run() on an owned thread. A terminal error is kept in lastError().
    void start();
    void stop();
    bool running() const { return running_.load(); }

    NtripState state() const { return state_.load(); }
    std::exception_ptr lastError() const;
    const NtripConfig &config() const { return config_; }

    // Consecutive failed connection attempts since the last successful stream.
    int failedAttempts() const { return failed_attempts_.load(); }

private:
    void streamSession(NtripSession &session);
    void maybeSendGga(NtripSession &session, NtripSession::Clock::time_point &next_gga);
    void setState(NtripState state);

    NtripConfig config_;
    CancellationToken token_;
    std::unique_ptr<NtripSession> session_;

    MessageHandler message_handler_;
    StateHandler state_handler_;
    FrameErrorHandler frame_error_handler_;

    std::atomic<NtripState> state_{NtripState::Disconnected};
    std::atomic<int> failed_attempts_{0};
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::optional<GeodeticCoordinate> rover_position_;
    std::exception_ptr last_error_;
};

} // namespace gnss_rtk_bridge
