#include "ThroughputMeter.h"

#include <algorithm>

namespace PeerBeam {

ThroughputMeter::ThroughputMeter(uint64_t totalBytes,
                                 std::chrono::milliseconds interval,
                                 ClockFn clock)
    : totalBytes_(totalBytes)
    , interval_(interval)
    , clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

void ThroughputMeter::start() {
    started_ = true;
    lastTime_ = clock_();
    lastBytes_ = 0;
}

std::optional<ProgressUpdate> ThroughputMeter::record(uint64_t bytesSoFar) {
    if (!started_) {
        start();
    }

    Clock::time_point now = clock_();
    auto elapsed = now - lastTime_;
    if (elapsed < interval_) {
        return std::nullopt;
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    uint64_t delta = bytesSoFar > lastBytes_ ? bytesSoFar - lastBytes_ : 0;

    ProgressUpdate update;
    update.bytesTransferred = bytesSoFar;
    update.totalBytes = totalBytes_;
    update.percent = std::max(percentFor(bytesSoFar), lastPercent_);
    update.bytesPerSecond = seconds > 0.0 ? static_cast<double>(delta) / seconds : 0.0;
    if (update.bytesPerSecond > 0.0) {
        uint64_t remaining = totalBytes_ > bytesSoFar ? totalBytes_ - bytesSoFar : 0;
        update.etaSeconds = static_cast<double>(remaining) / update.bytesPerSecond;
    }

    lastTime_ = now;
    lastBytes_ = std::max(bytesSoFar, lastBytes_);
    lastPercent_ = update.percent;
    return update;
}

ProgressUpdate ThroughputMeter::finish() {
    ProgressUpdate update;
    update.percent = 100.0;
    update.bytesPerSecond = 0.0;
    update.etaSeconds = 0.0;
    update.bytesTransferred = totalBytes_;
    update.totalBytes = totalBytes_;
    lastPercent_ = 100.0;
    return update;
}

double ThroughputMeter::percentFor(uint64_t bytes) const {
    if (totalBytes_ == 0) {
        return 100.0;
    }
    double percent = static_cast<double>(bytes) * 100.0 / static_cast<double>(totalBytes_);
    return std::clamp(percent, 0.0, 100.0);
}

} // namespace PeerBeam
