#pragma once

#include "rate_tracker.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace httpdl {

inline constexpr const char* kDefaultUserAgent = "httpdl";

// Per-request transport settings.
struct TransferConfig {
    std::string user_agent{kDefaultUserAgent};
    std::chrono::seconds connect_timeout{30};
    // Abort a transfer that receives no data for this long. Zero disables it.
    std::chrono::seconds stall_timeout{60};
    std::size_t buffer_size{64 * 1024};
    long max_redirects{10};
    // Extra raw header lines, "Name: value".
    std::vector<std::string> headers;
};

struct SessionOptions {
    std::function<RateTracker::TimePoint()> clock{[] { return RateTracker::Clock::now(); }};
    RateTracker::Clock::duration rate_window{RateTracker::kDefaultWindow};
};

struct RegistryConfig {
    std::filesystem::path download_dir{std::filesystem::current_path()};
    SessionOptions session;
};

} // namespace httpdl
