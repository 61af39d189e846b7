#include "httpdl/curl_http_client.hpp"
#include "httpdl/detail/curl_utils.hpp"
#include "httpdl/download_registry.hpp"
#include "httpdl/download_service.hpp"
#include "httpdl/error.hpp"
#include "httpdl/progress_panel.hpp"
#include "httpdl/transfer_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) { g_interrupted = true; }

struct Target {
    std::string url;
    std::optional<std::string> file;
};

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <url> [-o <file>] [<url> [-o <file>] ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Download directory (default: current directory)\n"
              << "  -o <file>        Destination for the preceding url (default: name from url)\n"
              << "  -A <agent>       User-Agent header (default: httpdl)\n"
              << "  -c <seconds>     Connect timeout (default: 30)\n"
              << "  -s <seconds>     Abort after this long without data, 0 disables (default: 60)\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message\n"
              << "Ctrl-C pauses every download and keeps the partial files." << std::endl;
}

std::chrono::seconds parseSeconds(const std::string& text, const char* what) {
    long value = 0;
    try {
        std::size_t consumed = 0;
        value = std::stol(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid {}: {}", what, text));
    }
    if (value < 0) {
        throw std::runtime_error(fmt::format("Invalid {}: {}", what, text));
    }
    return std::chrono::seconds{value};
}

} // namespace

int main(int argc, char** argv) {
    try {
        httpdl::detail::ensureCurlInitialized();

        httpdl::TransferConfig transfer_config;
        httpdl::RegistryConfig registry_config;
        bool verbose = false;
        std::vector<Target> targets;

        int arg_index = 1;
        while (arg_index < argc) {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "-v") {
                verbose = true;
                arg_index += 1;
            } else if (option == "-d" || option == "-o" || option == "-A" || option == "-c" ||
                       option == "-s") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];

                if (option == "-d") {
                    registry_config.download_dir = value;
                    std::error_code ec;
                    std::filesystem::create_directories(registry_config.download_dir, ec);
                    if (ec) {
                        throw std::runtime_error("Failed to create download directory: " + value +
                                                 " - " + ec.message());
                    }
                } else if (option == "-o") {
                    if (targets.empty()) {
                        throw std::runtime_error("-o must follow a url");
                    }
                    targets.back().file = value;
                } else if (option == "-A") {
                    transfer_config.user_agent = value;
                } else if (option == "-c") {
                    transfer_config.connect_timeout = parseSeconds(value, "connect timeout");
                } else {
                    transfer_config.stall_timeout = parseSeconds(value, "stall timeout");
                }
                arg_index += 2;
            } else if (!option.empty() && option[0] == '-') {
                printUsage(argv[0]);
                return 1;
            } else {
                targets.push_back({option, std::nullopt});
                arg_index += 1;
            }
        }

        if (targets.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        // the panel owns stdout, keep the log quiet unless asked for
        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

        auto client = std::make_shared<httpdl::CurlHttpClient>(std::move(transfer_config));
        httpdl::DownloadRegistry registry{client, registry_config};
        httpdl::DownloadService service{registry};

        bool failed = false;
        for (const auto& target : targets) {
            try {
                service.createDownload({target.url, target.file});
            } catch (const httpdl::DownloadError& ex) {
                std::cerr << "Cannot download " << target.url << ": " << ex.what() << std::endl;
                failed = true;
            }
        }

        std::signal(SIGINT, onInterrupt);

        httpdl::ProgressPanel panel{std::cout};
        while (true) {
            if (g_interrupted) {
                service.pauseAll();
                panel.render(service.listDownloads());
                std::cerr << "Interrupted, partial files kept." << std::endl;
                return 130;
            }

            panel.render(service.listDownloads());
            if (!service.hasActiveDownloads()) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        for (const auto& download : service.listDownloads()) {
            if (const auto* error = std::get_if<httpdl::state::Error>(&download.state)) {
                std::cerr << download.metadata.url << ": " << error->error << std::endl;
                failed = true;
            }
        }
        return failed ? 1 : 0;

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
