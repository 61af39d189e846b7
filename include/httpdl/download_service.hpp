#pragma once

#include "download_registry.hpp"
#include "download_state.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace httpdl {

struct CreateDownload {
    std::string url;
    std::optional<std::string> file_path;
};

// Command/query boundary for an API layer. Ids cross it as strings; every
// call maps onto one route of the HTTP API:
//
//   POST /api/v1/httpdownload              createDownload
//   GET  /api/v1/httpdownload/{id}         getDownload
//   POST /api/v1/httpdownload/{id}/pause   pauseDownload
//   POST /api/v1/httpdownload/{id}/resume  resumeDownload
//
// Failures are DownloadError; not_found maps to 404, invalid_transition to
// 409, invalid_url to 400, network_error to 502.
class DownloadService {
public:
    explicit DownloadService(DownloadRegistry& registry);

    DownloadData createDownload(const CreateDownload& request);
    [[nodiscard]] DownloadData getDownload(const std::string& id) const;
    DownloadData pauseDownload(const std::string& id);
    DownloadData resumeDownload(const std::string& id);

    [[nodiscard]] std::vector<DownloadData> listDownloads() const;
    std::size_t pauseAll();
    std::size_t resumeAll();

    // True while at least one download is Running.
    [[nodiscard]] bool hasActiveDownloads() const;

private:
    DownloadRegistry& registry_;
};

// HTTP status an API layer should answer with for a failed command.
[[nodiscard]] int httpStatusFor(Errc code) noexcept;

} // namespace httpdl
