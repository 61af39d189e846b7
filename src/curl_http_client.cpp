#include "httpdl/curl_http_client.hpp"

#include "httpdl/detail/curl_utils.hpp"
#include "httpdl/detail/http_headers.hpp"
#include "httpdl/error.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace httpdl {

namespace {

using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // namespace

class CurlHttpClient::Impl {
public:
    explicit Impl(TransferConfig config) : config_(std::move(config)) {
        detail::ensureCurlInitialized();
    }

    [[nodiscard]] ResponseHead probe(const std::string& url) const {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw DownloadError(Errc::network_error, "failed to allocate curl handle");
        }

        FetchContext ctx{curl.get()};
        char error_buffer[CURL_ERROR_SIZE] = {0};
        HeaderList headers = configure(curl.get(), url, ctx, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);

        spdlog::debug("HEAD {}", url);
        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }
        if (res != CURLE_OK) {
            throw DownloadError(Errc::network_error, describe(res, error_buffer));
        }

        ResponseHead head = makeHead(ctx);
        if (head.status == 405 || head.status == 501) {
            // HEAD refused, take the headers of a GET and drop the body
            spdlog::debug("HEAD not allowed for {}, probing with GET", url);
            head = ResponseHead{};
            fetch(FetchRequest{url, 0},
                  [&head](const ResponseHead& received) {
                      head = received;
                      return false;
                  },
                  [](const char*, std::size_t) { return false; },
                  {});
        }

        if (head.status >= 400) {
            throw DownloadError(Errc::network_error,
                                fmt::format("server responded with HTTP {} for {}", head.status, url));
        }
        return head;
    }

    FetchOutcome fetch(const FetchRequest& request,
                       const HeadHandler& on_head,
                       const ChunkHandler& on_chunk,
                       const InterruptCheck& interrupted) const {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            throw DownloadError(Errc::network_error, "failed to allocate curl handle");
        }

        FetchContext ctx{curl.get(), &on_head, &on_chunk, &interrupted};
        char error_buffer[CURL_ERROR_SIZE] = {0};
        HeaderList headers = configure(curl.get(), request.url, ctx, error_buffer);

        std::string range;
        if (request.offset > 0) {
            range = fmt::format("{}-", request.offset);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        spdlog::debug("GET {} (offset {})", request.url, request.offset);
        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }
        if (ctx.aborted) {
            return FetchOutcome::aborted;
        }

        // a body cut short against its Content-Length is still an end of
        // stream here, the session decides whether it is complete
        if (res == CURLE_OK || res == CURLE_PARTIAL_FILE) {
            if (!ctx.head_delivered && !deliverHead(ctx)) {
                return FetchOutcome::aborted;
            }
            return FetchOutcome::completed;
        }

        throw DownloadError(Errc::network_error, describe(res, error_buffer));
    }

private:
    struct FetchContext {
        CURL* curl{nullptr};
        const HeadHandler* on_head{nullptr};
        const ChunkHandler* on_chunk{nullptr};
        const InterruptCheck* interrupted{nullptr};

        detail::HeaderFields fields;

        bool head_delivered{false};
        bool aborted{false};
        // thrown by a handler inside a libcurl callback, rethrown after perform
        std::exception_ptr error;
    };

    HeaderList configure(CURL* curl, const std::string& url, FetchContext& ctx,
                         char* error_buffer) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.max_redirects);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout.count()));
        if (config_.stall_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout.count()));
        }
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(config_.buffer_size));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);

        HeaderList list{nullptr, &curl_slist_free_all};
        for (const auto& line : config_.headers) {
            curl_slist* appended = curl_slist_append(list.get(), line.c_str());
            if (!appended) {
                throw DownloadError(Errc::network_error, "failed to build request headers");
            }
            list.release();
            list.reset(appended);
        }
        if (list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list.get());
        }
        return list;
    }

    static ResponseHead makeHead(const FetchContext& ctx) {
        ResponseHead head;
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &head.status);

        curl_off_t length = -1;
        if (curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
            length >= 0) {
            head.content_length = static_cast<std::uint64_t>(length);
        }
        head.accepts_ranges = ctx.fields.accepts_ranges;
        if (ctx.fields.content_range) {
            head.range_start = ctx.fields.content_range->first;
            head.range_total = ctx.fields.content_range->total;
        }
        return head;
    }

    static bool deliverHead(FetchContext& ctx) {
        ctx.head_delivered = true;
        if (ctx.on_head && *ctx.on_head && !(*ctx.on_head)(makeHead(ctx))) {
            ctx.aborted = true;
            return false;
        }
        return true;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<FetchContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return 0;
        }
        try {
            detail::applyHeaderLine(std::string_view{buffer, total}, ctx->fields);
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<FetchContext*>(userdata);
        if (!ctx) {
            return 0;
        }

        const size_t total = size * nmemb;
        try {
            if (!ctx->head_delivered && !deliverHead(*ctx)) {
                return 0;
            }
            if (total == 0) {
                return 0;
            }
            if (ctx->on_chunk && *ctx->on_chunk && !(*ctx->on_chunk)(ptr, total)) {
                ctx->aborted = true;
                return 0;
            }
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;
        }
        return total;
    }

    static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<FetchContext*>(userdata);
        if (!ctx || !ctx->interrupted || !*ctx->interrupted) {
            return 0;
        }
        try {
            if ((*ctx->interrupted)()) {
                ctx->aborted = true;
                return 1;
            }
        } catch (...) {
            ctx->error = std::current_exception();
            return 1;
        }
        return 0;
    }

    static std::string describe(CURLcode res, const char* error_buffer) {
        if (error_buffer && error_buffer[0] != '\0') {
            return fmt::format("curl error: {}", error_buffer);
        }
        return fmt::format("curl error: {}", curl_easy_strerror(res));
    }

    TransferConfig config_;
};

CurlHttpClient::CurlHttpClient(TransferConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

CurlHttpClient::~CurlHttpClient() = default;

ResponseHead CurlHttpClient::probe(const std::string& url) { return impl_->probe(url); }

FetchOutcome CurlHttpClient::fetch(const FetchRequest& request,
                                   const HeadHandler& on_head,
                                   const ChunkHandler& on_chunk,
                                   const InterruptCheck& interrupted) {
    return impl_->fetch(request, on_head, on_chunk, interrupted);
}

} // namespace httpdl
