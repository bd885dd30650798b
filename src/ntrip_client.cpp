#include "gnss_rtk_bridge/ntrip_client.hpp"
#include "gnss_rtk_bridge/errors.hpp"
#include "gnss_rtk_bridge/nmea_encoder.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <utility>

namespace gnss_rtk_bridge {

namespace {

rclcpp::Logger logger() { return rclcpp::get_logger("gnss_rtk_bridge.ntrip"); }

// Recheck interval while no rover position is set.
constexpr double kGgaPollSeconds = 1.0;

} // namespace

//------------------------- Constructor -------------------------
NtripClient::NtripClient(NtripConfig config)
: config_(std::move(config))
{
    config_.validate();
}

NtripClient::~NtripClient() {
    stop();
}

void NtripClient::setRoverPosition(const GeodeticCoordinate &position) {
    std::lock_guard<std::mutex> lock(mutex_);
    rover_position_ = position;
}

void NtripClient::clearRoverPosition() {
    std::lock_guard<std::mutex> lock(mutex_);
    rover_position_.reset();
}

std::exception_ptr NtripClient::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void NtripClient::setState(NtripState state) {
    if (state_.exchange(state) == state) return;
    RCLCPP_DEBUG(logger(), "NTRIP state: %s", toString(state));
    if (state_handler_) state_handler_(state);
}

//------------------------- Run loop -------------------------
void NtripClient::run() {
    failed_attempts_.store(0);
    try {
        while (true) {
            session_ = std::make_unique<NtripSession>(config_, failed_attempts_.load() + 1);
            try {
                streamSession(*session_);
            } catch (const AuthenticationError &ex) {
                RCLCPP_ERROR(logger(), "%s", ex.what());
                throw;
            } catch (const NotFoundError &ex) {
                RCLCPP_ERROR(logger(), "%s", ex.what());
                throw;
            } catch (const OperationCancelled &) {
                throw;
            } catch (const GnssError &ex) {
                session_->close();
                const int failures = failed_attempts_.load() + 1;
                failed_attempts_.store(failures);
                if (config_.max_reconnect_attempts > 0 && failures > config_.max_reconnect_attempts) {
                    RCLCPP_ERROR(logger(), "%s; giving up after %d attempts", ex.what(), failures);
                    throw;
                }
                const double delay = config_.backoffDelay(failures);
                RCLCPP_WARN(logger(), "%s; reconnecting in %.1f s (attempt %d)", ex.what(), delay, failures);
                setState(NtripState::Reconnecting);
                sleepFor(Seconds(delay), token_);
            }
        }
    } catch (const OperationCancelled &) {
        RCLCPP_INFO(logger(), "NTRIP client cancelled");
        session_.reset();
        setState(NtripState::Disconnected);
    } catch (const std::exception &) {
        session_.reset();
        setState(NtripState::Disconnected);
        throw;
    }
}

void NtripClient::streamSession(NtripSession &session) {
    setState(NtripState::Connecting);
    session.connect(token_);
    setState(NtripState::AwaitingResponse);
    const std::vector<uint8_t> initial = session.awaitResponse(token_);

    failed_attempts_.store(0);
    setState(NtripState::Streaming);

    // Partial frames of a previous session are never spliced onto this one
    Rtcm3Decoder decoder(config_.max_rtcm_payload_length);
    if (frame_error_handler_) decoder.setErrorHandler(frame_error_handler_);
    const auto deliver = [this](RtcmMessage message) {
        if (message_handler_) message_handler_(std::move(message));
    };
    decoder.feed(initial, deliver);

    auto next_gga = NtripSession::Clock::now();
    while (true) {
        maybeSendGga(session, next_gga);

        Seconds max_wait(config_.idle_timeout_seconds);
        if (config_.gga_interval_seconds > 0.0) {
            const Seconds until_gga = next_gga - NtripSession::Clock::now();
            max_wait = std::min(max_wait, std::max(Seconds(0), until_gga));
        }

        const std::vector<uint8_t> chunk = session.readBody(max_wait, token_);
        if (!chunk.empty()) decoder.feed(chunk, deliver);
    }
}

void NtripClient::maybeSendGga(NtripSession &session, NtripSession::Clock::time_point &next_gga) {
    if (config_.gga_interval_seconds <= 0.0) return;
    const auto now = NtripSession::Clock::now();
    if (now < next_gga) return;

    std::optional<GeodeticCoordinate> position;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        position = rover_position_;
    }
    if (!position) {
        next_gga = now + std::chrono::duration_cast<NtripSession::Clock::duration>(Seconds(kGgaPollSeconds));
        return;
    }

    session.send(formatGgaForPosition(*position), token_);
    next_gga = now + std::chrono::duration_cast<NtripSession::Clock::duration>(
                         Seconds(config_.gga_interval_seconds));
    RCLCPP_DEBUG(logger(), "Sent GGA for %s", position->format().c_str());
}

//------------------------- Thread -------------------------
void NtripClient::start() {
    stop();
    token_.reset();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = nullptr;
    }
    running_.store(true);
    thread_ = std::thread([this]() {
        try {
            run();
        } catch (const std::exception &ex) {
            RCLCPP_ERROR(logger(), "NTRIP client stopped: %s", ex.what());
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = std::current_exception();
        }
        running_.store(false);
    });
}

void NtripClient::stop() {
    cancel();
    if (thread_.joinable()) thread_.join();
}

} // namespace gnss_rtk_bridge
