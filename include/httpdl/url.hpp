#pragma once

#include <optional>
#include <string>

namespace httpdl {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string path;
};

// Validates an absolute http(s) URL. Throws DownloadError(invalid_url).
[[nodiscard]] ParsedUrl parseUrl(const std::string& url);

// Last path segment of the URL, percent-decoded. Nothing when the path ends
// in '/' or the segment cannot be used as a file name.
[[nodiscard]] std::optional<std::string> fileNameFromUrl(const std::string& url);

} // namespace httpdl
