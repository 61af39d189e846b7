#pragma once

#include "download_state.hpp"
#include "http_client.hpp"
#include "transfer_config.hpp"
#include "transfer_session.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace httpdl {

// Owns every known download. Inserting happens only in create(); lookups
// share the map lock, and commands on one download are serialized by that
// download's own mutex so different downloads never wait on each other.
class DownloadRegistry {
public:
    explicit DownloadRegistry(HttpClientPtr client, RegistryConfig config = {});
    ~DownloadRegistry();

    DownloadRegistry(const DownloadRegistry&) = delete;
    DownloadRegistry& operator=(const DownloadRegistry&) = delete;

    // Validates the URL, probes it for its length, registers the download
    // and starts it. Throws DownloadError(invalid_url | network_error); no
    // entry exists afterwards when it throws.
    DownloadMetadata create(const std::string& url,
                            const std::optional<std::string>& file_path = std::nullopt);

    [[nodiscard]] DownloadData get(const DownloadId& id) const;
    [[nodiscard]] std::vector<DownloadData> list() const;

    void pause(const DownloadId& id);
    void resume(const DownloadId& id);

    // Best-effort bulk commands, return how many downloads changed.
    std::size_t pauseAll();
    std::size_t resumeAll();

    // Blocks until the download's current run has ended.
    void wait(const DownloadId& id) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const RegistryConfig& config() const noexcept { return config_; }

private:
    struct Entry {
        Entry(DownloadMetadata metadata, TransferSessionPtr session)
            : metadata(std::move(metadata)), session(std::move(session)) {}

        const DownloadMetadata metadata;
        TransferSessionPtr session;
        std::mutex command_mutex;
    };

    using EntryPtr = std::shared_ptr<Entry>;

    [[nodiscard]] EntryPtr find(const DownloadId& id) const;
    [[nodiscard]] std::vector<EntryPtr> snapshotEntries() const;
    [[nodiscard]] std::string resolvePath(const DownloadId& id, const std::string& url,
                                          const std::optional<std::string>& file_path) const;
    [[nodiscard]] bool isPathClaimed(const std::string& path) const;

    HttpClientPtr client_;
    RegistryConfig config_;

    mutable std::shared_mutex entries_mutex_;
    std::map<DownloadId, EntryPtr> entries_;
    std::vector<DownloadId> order_;
};

} // namespace httpdl
