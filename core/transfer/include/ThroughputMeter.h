#pragma once

#include "TransferTypes.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace PeerBeam {

/**
 * @brief Rate-limited progress, speed and ETA for one transfer direction
 *
 * record() only yields an update once `interval` of wall-clock time has
 * passed since the previous one; speed is measured over that window.
 * An interval of zero reports on every call.
 */
class ThroughputMeter {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    ThroughputMeter(uint64_t totalBytes,
                    std::chrono::milliseconds interval,
                    ClockFn clock = nullptr);

    /// Reset the measurement window to now. Called implicitly by the first record().
    void start();

    std::optional<ProgressUpdate> record(uint64_t bytesSoFar);

    /// {100%, 0 B/s, ETA 0}
    ProgressUpdate finish();

    double lastPercent() const { return lastPercent_; }
    uint64_t totalBytes() const { return totalBytes_; }

private:
    double percentFor(uint64_t bytes) const;

    uint64_t totalBytes_;
    std::chrono::milliseconds interval_;
    ClockFn clock_;

    bool started_{false};
    Clock::time_point lastTime_{};
    uint64_t lastBytes_{0};
    double lastPercent_{0.0};
};

} // namespace PeerBeam
