#include "httpdl/progress_panel.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

#include <fmt/format.h>

namespace httpdl {

namespace {

constexpr int kBarWidth = 30;
constexpr std::size_t kNameWidth = 20;

std::string displayName(const std::string& file_path) {
    std::string name;
    if (!file_path.empty()) {
        name = std::filesystem::path{file_path}.filename().string();
    }
    if (name.empty()) {
        name = file_path;
    }
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth);
    }
    if (name.empty()) {
        name = "(unnamed)";
    }
    return name;
}

std::string progressBar(double ratio) {
    const int filled = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < filled) ? u8"█" : u8"░";
    }
    return bar;
}

} // namespace

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

void ProgressPanel::render(const std::vector<DownloadData>& downloads) {
    const auto panel = buildPanel(downloads);
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

std::string ProgressPanel::buildPanel(const std::vector<DownloadData>& downloads) {
    std::string panel;
    panel.reserve(downloads.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("httpdl ({} downloads)\n", downloads.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& download : downloads) {
        panel += formatLine(download);
        panel.push_back('\n');

        const auto total = download.metadata.content_length;
        total_all += total;
        if (std::holds_alternative<state::Complete>(download.state)) {
            downloaded_all += total;
        } else {
            downloaded_all += std::min(total, bytesDownloaded(download.state).value_or(0));
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatLine(const DownloadData& download) {
    const auto name = displayName(download.metadata.file_path);
    const auto total = download.metadata.content_length;

    if (const auto* error = std::get_if<state::Error>(&download.state)) {
        return fmt::format("{:<20} ❌ {}", name, error->error);
    }

    const bool complete = std::holds_alternative<state::Complete>(download.state);
    const auto bytes = complete ? total : bytesDownloaded(download.state).value_or(0);

    std::string line;
    if (total > 0) {
        const double ratio = static_cast<double>(bytes) / static_cast<double>(total);
        line = fmt::format("{:<20} [{}] {:>3}% ({}/{})", name, progressBar(ratio),
                           static_cast<int>(ratio * 100.0), formatSize(bytes), formatSize(total));
    } else if (complete) {
        line = fmt::format("{:<20} [{}] done", name, progressBar(1.0));
    } else {
        line = fmt::format("{:<20} [size unknown] {}", name, formatSize(bytes));
    }

    if (const auto* running = std::get_if<state::Running>(&download.state)) {
        line += fmt::format("  {}/s", formatSize(running->bytes_per_second));
    } else if (std::holds_alternative<state::Paused>(download.state)) {
        line.append("  ⏸ Paused");
    } else if (complete) {
        line.append("  ✅ Done");
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace httpdl
