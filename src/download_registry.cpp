#include "httpdl/download_registry.hpp"

#include "httpdl/error.hpp"
#include "httpdl/url.hpp"

#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace httpdl {

namespace fs = std::filesystem;

DownloadRegistry::DownloadRegistry(HttpClientPtr client, RegistryConfig config)
    : client_(std::move(client)), config_(std::move(config)) {
    if (!client_) {
        throw std::invalid_argument("DownloadRegistry requires an http client");
    }
}

DownloadRegistry::~DownloadRegistry() {
    for (const auto& entry : snapshotEntries()) {
        entry->session->cancel();
    }
}

DownloadMetadata DownloadRegistry::create(const std::string& url,
                                          const std::optional<std::string>& file_path) {
    // everything that can be rejected without I/O is rejected first
    (void)parseUrl(url);
    const bool derive_path = !file_path || file_path->empty();
    if (derive_path && !fileNameFromUrl(url)) {
        throw DownloadError(Errc::invalid_url, fmt::format("no file name in '{}'", url));
    }

    const ResponseHead head = client_->probe(url);
    if (!head.accepts_ranges) {
        spdlog::warn("{} does not advertise byte ranges, a paused download may not resume", url);
    }

    DownloadMetadata metadata;
    metadata.id = newDownloadId();
    metadata.url = url;
    metadata.content_length = head.content_length.value_or(0);

    {
        std::unique_lock<std::shared_mutex> lock(entries_mutex_);
        metadata.file_path = resolvePath(metadata.id, url,
                                         derive_path ? std::optional<std::string>{} : file_path);
        auto session = std::make_shared<TransferSession>(metadata, client_, config_.session);
        // readers only ever see the entry once its first state is published
        session->start();
        entries_.emplace(metadata.id, std::make_shared<Entry>(metadata, std::move(session)));
        order_.push_back(metadata.id);
    }

    spdlog::info("Created download {} for {} -> {} ({} bytes)", toString(metadata.id), url,
                 metadata.file_path, metadata.content_length);
    return metadata;
}

DownloadData DownloadRegistry::get(const DownloadId& id) const {
    const auto entry = find(id);
    return {entry->metadata, entry->session->state()};
}

std::vector<DownloadData> DownloadRegistry::list() const {
    std::vector<DownloadData> result;
    const auto entries = snapshotEntries();
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back({entry->metadata, entry->session->state()});
    }
    return result;
}

void DownloadRegistry::pause(const DownloadId& id) {
    const auto entry = find(id);
    std::lock_guard<std::mutex> command_lock(entry->command_mutex);
    spdlog::debug("Pause requested for {}", toString(id));
    entry->session->pause();
}

void DownloadRegistry::resume(const DownloadId& id) {
    const auto entry = find(id);
    std::lock_guard<std::mutex> command_lock(entry->command_mutex);
    spdlog::debug("Resume requested for {}", toString(id));
    entry->session->start();
}

std::size_t DownloadRegistry::pauseAll() {
    std::size_t paused = 0;
    for (const auto& entry : snapshotEntries()) {
        std::lock_guard<std::mutex> command_lock(entry->command_mutex);
        if (!entry->session->isActive()) {
            continue;
        }
        try {
            entry->session->pause();
            ++paused;
        } catch (const DownloadError& e) {
            // the transfer ended between the check and the pause
            if (e.errc() != Errc::invalid_transition) {
                throw;
            }
            spdlog::debug("Skipping pause of {}: {}", toString(entry->metadata.id), e.what());
        }
    }
    return paused;
}

std::size_t DownloadRegistry::resumeAll() {
    std::size_t resumed = 0;
    for (const auto& entry : snapshotEntries()) {
        std::lock_guard<std::mutex> command_lock(entry->command_mutex);
        if (!entry->session->isPaused()) {
            continue;
        }
        entry->session->start();
        ++resumed;
    }
    return resumed;
}

void DownloadRegistry::wait(const DownloadId& id) const {
    find(id)->session->wait();
}

std::size_t DownloadRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    return entries_.size();
}

DownloadRegistry::EntryPtr DownloadRegistry::find(const DownloadId& id) const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw DownloadError(Errc::not_found, toString(id));
    }
    return it->second;
}

std::vector<DownloadRegistry::EntryPtr> DownloadRegistry::snapshotEntries() const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    std::vector<EntryPtr> entries;
    entries.reserve(order_.size());
    for (const auto& id : order_) {
        entries.push_back(entries_.at(id));
    }
    return entries;
}

// Caller holds the map lock exclusively.
std::string DownloadRegistry::resolvePath(const DownloadId& id, const std::string& url,
                                          const std::optional<std::string>& file_path) const {
    if (file_path) {
        fs::path path{*file_path};
        if (path.is_relative()) {
            path = config_.download_dir / path;
        }
        return path.lexically_normal().string();
    }

    const auto name = fileNameFromUrl(url).value_or("download");
    fs::path path = (config_.download_dir / name).lexically_normal();

    std::error_code ec;
    if (fs::exists(path, ec) || isPathClaimed(path.string())) {
        path = (config_.download_dir / fmt::format("{}-{}", toString(id), name)).lexically_normal();
    }
    return path.string();
}

bool DownloadRegistry::isPathClaimed(const std::string& path) const {
    for (const auto& item : entries_) {
        if (item.second->metadata.file_path == path) {
            return true;
        }
    }
    return false;
}

} // namespace httpdl
