#include "httpdl/download_service.hpp"

#include "httpdl/error.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace httpdl {

DownloadService::DownloadService(DownloadRegistry& registry) : registry_(registry) {}

DownloadData DownloadService::createDownload(const CreateDownload& request) {
    const auto metadata = registry_.create(request.url, request.file_path);
    return registry_.get(metadata.id);
}

DownloadData DownloadService::getDownload(const std::string& id) const {
    return registry_.get(parseDownloadId(id));
}

DownloadData DownloadService::pauseDownload(const std::string& id) {
    const auto download_id = parseDownloadId(id);
    registry_.pause(download_id);
    return registry_.get(download_id);
}

DownloadData DownloadService::resumeDownload(const std::string& id) {
    const auto download_id = parseDownloadId(id);
    registry_.resume(download_id);
    return registry_.get(download_id);
}

std::vector<DownloadData> DownloadService::listDownloads() const {
    return registry_.list();
}

std::size_t DownloadService::pauseAll() {
    const auto count = registry_.pauseAll();
    spdlog::info("Paused {} download(s)", count);
    return count;
}

std::size_t DownloadService::resumeAll() {
    const auto count = registry_.resumeAll();
    spdlog::info("Resumed {} download(s)", count);
    return count;
}

bool DownloadService::hasActiveDownloads() const {
    const auto downloads = registry_.list();
    return std::any_of(downloads.begin(), downloads.end(),
                       [](const DownloadData& data) { return isRunning(data.state); });
}

int httpStatusFor(Errc code) noexcept {
    switch (code) {
        case Errc::invalid_url:           return 400;
        case Errc::not_found:             return 404;
        case Errc::invalid_transition:    return 409;
        case Errc::network_error:         return 502;
        case Errc::range_not_satisfiable: return 416;
        case Errc::incomplete_transfer:
        case Errc::io_error:              return 500;
    }
    return 500;
}

} // namespace httpdl
