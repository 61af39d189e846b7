#include "httpdl/rate_tracker.hpp"

namespace httpdl {

RateTracker::RateTracker(Clock::duration window)
    : window_(window > Clock::duration::zero() ? window : Clock::duration{kDefaultWindow}) {}

std::uint64_t RateTracker::sample(TimePoint timestamp, std::uint64_t total_bytes) {
    if (!samples_.empty() && total_bytes < samples_.back().total_bytes) {
        // the counter went backwards, the old history is meaningless
        samples_.clear();
    }

    samples_.push_back({timestamp, total_bytes});

    // keep the oldest sample that still covers the window so the span never
    // shrinks below it while data keeps arriving
    while (samples_.size() > 2 &&
           timestamp - samples_[1].timestamp >= window_) {
        samples_.pop_front();
    }
    while (samples_.size() > kMaxSamples) {
        samples_.pop_front();
    }

    rate_ = computeRate();
    return rate_;
}

void RateTracker::reset() noexcept {
    samples_.clear();
    rate_ = 0;
}

std::uint64_t RateTracker::computeRate() const {
    if (samples_.size() < 2) {
        return 0;
    }

    const Sample& oldest = samples_.front();
    const Sample& newest = samples_.back();
    if (newest.timestamp <= oldest.timestamp || newest.total_bytes <= oldest.total_bytes) {
        return 0;
    }

    const auto elapsed_us =
        std::chrono::duration_cast<std::chrono::microseconds>(newest.timestamp - oldest.timestamp)
            .count();
    if (elapsed_us <= 0) {
        return 0;
    }

    const double bytes = static_cast<double>(newest.total_bytes - oldest.total_bytes);
    return static_cast<std::uint64_t>(bytes * 1'000'000.0 / static_cast<double>(elapsed_us));
}

} // namespace httpdl
