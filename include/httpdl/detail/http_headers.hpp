#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace httpdl::detail {

// "Content-Range: bytes <first>-<last>/<total or *>"
struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total;
};

[[nodiscard]] std::optional<ContentRange> parseContentRange(std::string_view value);

// Header fields the transfers care about, collected for the current response.
struct HeaderFields {
    bool accepts_ranges{false};
    std::optional<ContentRange> content_range;
};

// Feeds one raw header line as delivered by the transport. A status line
// starts a new response (a redirect hop), which clears what was collected.
void applyHeaderLine(std::string_view line, HeaderFields& fields);

} // namespace httpdl::detail
