#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace httpdl {

struct ResponseHead {
    long status{0};
    // Length of this response's body, as announced by the server.
    std::optional<std::uint64_t> content_length;
    // First byte and total size from Content-Range, on partial responses.
    std::optional<std::uint64_t> range_start;
    std::optional<std::uint64_t> range_total;
    bool accepts_ranges{false};
};

struct FetchRequest {
    std::string url;
    // Sends "Range: bytes=<offset>-" when non-zero.
    std::uint64_t offset{0};
};

enum class FetchOutcome {
    // The server closed the body stream.
    completed,
    // A handler returned false or the interrupt check fired.
    aborted,
};

// Transport seam used by the sessions. Implementations report transport
// failures by throwing DownloadError(network_error); HTTP error statuses are
// not failures at this level and are handed to the head handler.
class HttpClient {
public:
    using HeadHandler = std::function<bool(const ResponseHead&)>;
    using ChunkHandler = std::function<bool(const char* data, std::size_t size)>;
    using InterruptCheck = std::function<bool()>;

    virtual ~HttpClient() = default;

    // Resolves the response head of a URL without downloading the body.
    [[nodiscard]] virtual ResponseHead probe(const std::string& url) = 0;

    // Streams the body of a GET. on_head runs once before the first chunk,
    // on_chunk for every piece of body in order. interrupted is polled while
    // waiting for data.
    virtual FetchOutcome fetch(const FetchRequest& request,
                               const HeadHandler& on_head,
                               const ChunkHandler& on_chunk,
                               const InterruptCheck& interrupted) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace httpdl
