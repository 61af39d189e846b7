#pragma once

#include "error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <boost/uuid/uuid.hpp>

namespace httpdl {

using DownloadId = boost::uuids::uuid;

[[nodiscard]] DownloadId newDownloadId();
[[nodiscard]] std::string toString(const DownloadId& id);
// Throws DownloadError(not_found) for strings that are not a UUID.
[[nodiscard]] DownloadId parseDownloadId(const std::string& text);

struct DownloadMetadata {
    DownloadId id{};
    std::string url;
    std::string file_path;
    // 0 when the server did not report a length.
    std::uint64_t content_length{0};
};

namespace state {

struct Running {
    std::uint64_t bytes_downloaded{0};
    std::uint64_t bytes_per_second{0};
};

struct Paused {
    std::uint64_t bytes_downloaded{0};
};

struct Complete {};

struct Error {
    std::string error;
    Errc code{Errc::network_error};
};

} // namespace state

using DownloadState = std::variant<state::Running, state::Paused, state::Complete, state::Error>;

struct DownloadData {
    DownloadMetadata metadata;
    DownloadState state;
};

// Title of the active alternative: "Running", "Paused", "Complete" or "Error".
[[nodiscard]] std::string_view stateName(const DownloadState& state) noexcept;

// Byte count carried by Running and Paused, nothing for the other states.
[[nodiscard]] std::optional<std::uint64_t> bytesDownloaded(const DownloadState& state) noexcept;

[[nodiscard]] inline bool isRunning(const DownloadState& state) noexcept {
    return std::holds_alternative<state::Running>(state);
}

} // namespace httpdl
