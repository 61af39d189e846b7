#include "httpdl/detail/http_headers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace httpdl::detail {

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

std::optional<std::uint64_t> parseNumber(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<ContentRange> parseContentRange(std::string_view value) {
    value = trim(value);
    if (value.size() < 6 || !equalsIgnoreCase(value.substr(0, 6), "bytes ")) {
        return std::nullopt;
    }
    value.remove_prefix(6);

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    const auto first = parseNumber(trim(value.substr(0, dash)));
    const auto last = parseNumber(trim(value.substr(dash + 1, slash - dash - 1)));
    if (!first || !last || *first > *last) {
        return std::nullopt;
    }

    ContentRange range;
    range.first = *first;
    range.last = *last;

    const auto total_text = trim(value.substr(slash + 1));
    if (total_text != "*") {
        range.total = parseNumber(total_text);
        if (!range.total || *range.total <= range.last) {
            return std::nullopt;
        }
    }
    return range;
}

void applyHeaderLine(std::string_view line, HeaderFields& fields) {
    line = trim(line);
    if (line.size() >= 5 && equalsIgnoreCase(line.substr(0, 5), "HTTP/")) {
        fields = HeaderFields{};
        return;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;
    }
    const std::string_view name = trim(line.substr(0, colon));
    const std::string_view value = trim(line.substr(colon + 1));

    if (equalsIgnoreCase(name, "Accept-Ranges")) {
        fields.accepts_ranges = equalsIgnoreCase(value, "bytes");
    } else if (equalsIgnoreCase(name, "Content-Range")) {
        fields.content_range = parseContentRange(value);
    }
}

} // namespace httpdl::detail
