#include "httpdl/url.hpp"

#include "httpdl/detail/curl_utils.hpp"
#include "httpdl/error.hpp"

#include <algorithm>
#include <cctype>

namespace httpdl {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    if (url.empty()) {
        throw DownloadError(Errc::invalid_url, "empty url");
    }

    auto handle = detail::makeCurlUrlHandle();
    if (!handle) {
        throw DownloadError(Errc::invalid_url, "cannot allocate url parser");
    }

    const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw DownloadError(Errc::invalid_url, "'" + url + "'");
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(detail::urlPart(handle.get(), CURLUPART_SCHEME));
    parsed.host = detail::urlPart(handle.get(), CURLUPART_HOST);
    parsed.path = detail::urlPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE);

    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw DownloadError(Errc::invalid_url, "unsupported scheme in '" + url + "'");
    }
    if (parsed.host.empty()) {
        throw DownloadError(Errc::invalid_url, "missing host in '" + url + "'");
    }
    return parsed;
}

std::optional<std::string> fileNameFromUrl(const std::string& url) {
    const ParsedUrl parsed = parseUrl(url);

    const auto slash = parsed.path.find_last_of('/');
    std::string name = slash == std::string::npos ? parsed.path : parsed.path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return name;
}

} // namespace httpdl
