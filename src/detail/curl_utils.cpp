#include "httpdl/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace httpdl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

CurlUrlHandle makeCurlUrlHandle() {
    ensureCurlInitialized();
    return CurlUrlHandle{curl_url(), &curl_url_cleanup};
}

std::string urlPart(CURLU* url, CURLUPart part, unsigned int flags) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, flags) != CURLUE_OK || !value) {
        return {};
    }
    std::string result{value};
    curl_free(value);
    return result;
}

} // namespace httpdl::detail
