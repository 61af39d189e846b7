#pragma once

#include "http_client.hpp"
#include "transfer_config.hpp"

#include <memory>
#include <string>

namespace httpdl {

// HttpClient on top of libcurl's easy interface. One easy handle per request,
// so a single instance can be shared by any number of sessions.
class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(TransferConfig config = {});
    ~CurlHttpClient() override;

    [[nodiscard]] ResponseHead probe(const std::string& url) override;
    FetchOutcome fetch(const FetchRequest& request,
                       const HeadHandler& on_head,
                       const ChunkHandler& on_chunk,
                       const InterruptCheck& interrupted) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace httpdl
