#pragma once

#include "download_state.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace httpdl {

// Terminal view of a set of downloads, redrawn in place.
class ProgressPanel {
public:
    explicit ProgressPanel(std::ostream& out);

    void render(const std::vector<DownloadData>& downloads);

    [[nodiscard]] static std::string buildPanel(const std::vector<DownloadData>& downloads);
    [[nodiscard]] static std::string formatLine(const DownloadData& download);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace httpdl
