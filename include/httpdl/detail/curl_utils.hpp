#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace httpdl::detail {

void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

[[nodiscard]] CurlHandle makeCurlHandle();
[[nodiscard]] CurlUrlHandle makeCurlUrlHandle();

// Reads one component of a parsed URL, empty when the component is absent.
[[nodiscard]] std::string urlPart(CURLU* url, CURLUPart part, unsigned int flags = 0);

} // namespace httpdl::detail
