#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace httpdl {

// Smoothed transfer rate over a short rolling window of
// (timestamp, total bytes) samples.
class RateTracker {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::chrono::milliseconds kDefaultWindow{2000};
    static constexpr std::size_t kMaxSamples = 64;

    explicit RateTracker(Clock::duration window = kDefaultWindow);

    // Records a sample and returns the current rate in bytes per second.
    // Degenerate input (fewer than two samples, no elapsed time, no progress)
    // yields 0.
    std::uint64_t sample(TimePoint timestamp, std::uint64_t total_bytes);

    [[nodiscard]] std::uint64_t rate() const noexcept { return rate_; }
    void reset() noexcept;

private:
    struct Sample {
        TimePoint timestamp;
        std::uint64_t total_bytes;
    };

    [[nodiscard]] std::uint64_t computeRate() const;

    Clock::duration window_;
    std::deque<Sample> samples_;
    std::uint64_t rate_{0};
};

} // namespace httpdl
