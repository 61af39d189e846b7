#include "httpdl/transfer_session.hpp"

#include "httpdl/error.hpp"
#include "httpdl/rate_tracker.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace httpdl {

class TransferSession::Impl {
public:
    Impl(DownloadMetadata metadata, HttpClientPtr client, SessionOptions options)
        : metadata_(std::move(metadata)),
          client_(std::move(client)),
          options_(std::move(options)),
          rate_(options_.rate_window) {
        if (!client_) {
            throw std::invalid_argument("TransferSession requires an http client");
        }
        if (!options_.clock) {
            options_.clock = [] { return RateTracker::Clock::now(); };
        }
    }

    ~Impl() { cancel(); }

    void start() {
        std::lock_guard<std::mutex> worker_lock(worker_mutex_);

        std::uint64_t offset = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (phase_ == Phase::running) {
                throw DownloadError(Errc::invalid_transition, "download is already running");
            }
            if (phase_ == Phase::complete) {
                throw DownloadError(Errc::invalid_transition, "download is already complete");
            }
            offset = bytes_downloaded_;
        }

        if (worker_.joinable()) {
            worker_.join();
        }
        stop_requested_ = false;

        if (offset > 0) {
            std::error_code ec;
            const auto on_disk = std::filesystem::file_size(metadata_.file_path, ec);
            if (ec || on_disk != offset) {
                const std::string detail =
                    ec ? fmt::format("cannot stat partial file '{}': {}", metadata_.file_path, ec.message())
                       : fmt::format("partial file length mismatch: '{}' has {} bytes, expected {}",
                                     metadata_.file_path, on_disk, offset);
                spdlog::error("Refusing to resume {}: {}", toString(metadata_.id), detail);
                publishFailure(DownloadError(Errc::io_error, detail));
                return;
            }
            if (metadata_.content_length > 0 && offset == metadata_.content_length) {
                spdlog::info("Download {} already has all {} bytes", toString(metadata_.id), offset);
                publish(Phase::complete, state::Complete{});
                return;
            }
            spdlog::info("Resuming download {} at byte {}", toString(metadata_.id), offset);
        } else {
            spdlog::info("Starting download {} from {}", toString(metadata_.id), metadata_.url);
        }

        Phase previous_phase{Phase::created};
        DownloadState previous_state;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            previous_phase = phase_;
            previous_state = state_;
        }

        rate_.reset();
        const auto rate = rate_.sample(options_.clock(), offset);
        publish(Phase::running, state::Running{offset, rate});

        try {
            worker_ = std::thread([this, offset] { run(offset); });
        } catch (const std::system_error& e) {
            spdlog::error("Cannot start worker for {}: {}", toString(metadata_.id), e.what());
            publish(previous_phase, std::move(previous_state));
            throw;
        }
    }

    void pause() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (phase_ == Phase::paused) {
                return;
            }
            if (phase_ != Phase::running) {
                throw DownloadError(Errc::invalid_transition,
                                    fmt::format("cannot pause a download in state {}", stateName(state_)));
            }
        }

        stop_requested_ = true;
        joinWorker();
    }

    void cancel() {
        stop_requested_ = true;
        joinWorker();
    }

    void wait() { joinWorker(); }

    [[nodiscard]] DownloadState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    [[nodiscard]] std::uint64_t bytesDownloaded() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return bytes_downloaded_;
    }

    [[nodiscard]] bool isActive() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return phase_ == Phase::running;
    }

    [[nodiscard]] bool isPaused() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return phase_ == Phase::paused;
    }

    [[nodiscard]] const DownloadMetadata& metadata() const noexcept { return metadata_; }

private:
    enum class Phase { created, running, paused, complete, failed };

    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    using FilePtr = std::unique_ptr<FILE, FileDeleter>;

    void run(std::uint64_t offset) {
        const std::string id = toString(metadata_.id);

        FilePtr file{std::fopen(metadata_.file_path.c_str(), offset > 0 ? "ab" : "wb")};
        if (!file) {
            publishFailure(DownloadError(Errc::io_error,
                                         fmt::format("cannot open '{}': {}", metadata_.file_path,
                                                     std::strerror(errno))));
            return;
        }

        std::uint64_t bytes = offset;
        std::optional<DownloadError> failure;

        auto on_head = [&](const ResponseHead& head) {
            if (stop_requested_) {
                return false;
            }
            if (offset == 0) {
                if (head.status != 200) {
                    failure = DownloadError(Errc::network_error,
                                            fmt::format("server responded with HTTP {}", head.status));
                    return false;
                }
                return true;
            }
            if (head.status != 206 || (head.range_start && *head.range_start != offset)) {
                spdlog::warn("Server did not honor range request for {} at byte {} (HTTP {})", id,
                             offset, head.status);
                failure = DownloadError(Errc::range_not_satisfiable);
                return false;
            }
            return true;
        };

        auto on_chunk = [&](const char* data, std::size_t size) {
            if (stop_requested_) {
                return false;
            }
            if (metadata_.content_length > 0 && bytes + size > metadata_.content_length) {
                failure = DownloadError(Errc::network_error, "server sent more data than announced");
                return false;
            }
            if (std::fwrite(data, 1, size, file.get()) != size) {
                failure = DownloadError(Errc::io_error,
                                        fmt::format("failed to write '{}'", metadata_.file_path));
                return false;
            }

            bytes += size;
            const auto rate = rate_.sample(options_.clock(), bytes);
            publish(Phase::running, state::Running{bytes, rate});
            return true;
        };

        auto interrupted = [this] { return stop_requested_.load(); };

        FetchOutcome outcome = FetchOutcome::aborted;
        try {
            outcome = client_->fetch(FetchRequest{metadata_.url, offset}, on_head, on_chunk, interrupted);
        } catch (const DownloadError& e) {
            failure = e;
        } catch (const std::exception& e) {
            failure = DownloadError(Errc::network_error, e.what());
        }

        const bool flushed = std::fflush(file.get()) == 0;
        const bool closed = std::fclose(file.release()) == 0;

        if (failure) {
            spdlog::error("Download {} failed after {} bytes: {}", id, bytes, failure->what());
            publishFailure(*failure);
            return;
        }
        if (!flushed || !closed) {
            publishFailure(DownloadError(Errc::io_error,
                                         fmt::format("failed to flush '{}'", metadata_.file_path)));
            return;
        }

        if (outcome == FetchOutcome::aborted) {
            if (metadata_.content_length > 0 && bytes == metadata_.content_length) {
                // the stop arrived after the last byte
                spdlog::info("Download {} complete, {} bytes written to {}", id, bytes,
                             metadata_.file_path);
                publish(Phase::complete, state::Complete{});
            } else if (stop_requested_) {
                spdlog::info("Download {} paused at byte {}", id, bytes);
                publish(Phase::paused, state::Paused{bytes});
            } else {
                publishFailure(DownloadError(Errc::network_error, "transfer aborted"));
            }
            return;
        }

        if (metadata_.content_length > 0 && bytes < metadata_.content_length) {
            spdlog::error("Download {} stream ended at {} of {} bytes", id, bytes,
                          metadata_.content_length);
            publishFailure(DownloadError(Errc::incomplete_transfer));
            return;
        }

        spdlog::info("Download {} complete, {} bytes written to {}", id, bytes, metadata_.file_path);
        publish(Phase::complete, state::Complete{});
    }

    void publish(Phase phase, DownloadState next) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (const auto bytes = httpdl::bytesDownloaded(next)) {
            bytes_downloaded_ = *bytes;
        }
        phase_ = phase;
        state_ = std::move(next);
    }

    void publishFailure(const DownloadError& error) {
        publish(Phase::failed, state::Error{error.what(), error.errc()});
    }

    void joinWorker() {
        std::lock_guard<std::mutex> worker_lock(worker_mutex_);
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    const DownloadMetadata metadata_;
    HttpClientPtr client_;
    SessionOptions options_;

    // touched by start() before the worker exists and by the worker after
    RateTracker rate_;

    std::atomic<bool> stop_requested_{false};
    std::mutex worker_mutex_;
    std::thread worker_;

    mutable std::mutex state_mutex_;
    Phase phase_{Phase::created};
    DownloadState state_{state::Paused{0}};
    std::uint64_t bytes_downloaded_{0};
};

TransferSession::TransferSession(DownloadMetadata metadata, HttpClientPtr client, SessionOptions options)
    : impl_(std::make_unique<Impl>(std::move(metadata), std::move(client), std::move(options))) {}

TransferSession::~TransferSession() = default;

void TransferSession::start() { impl_->start(); }

void TransferSession::pause() { impl_->pause(); }

void TransferSession::cancel() { impl_->cancel(); }

void TransferSession::wait() { impl_->wait(); }

DownloadState TransferSession::state() const { return impl_->state(); }

std::uint64_t TransferSession::bytesDownloaded() const { return impl_->bytesDownloaded(); }

bool TransferSession::isActive() const { return impl_->isActive(); }

bool TransferSession::isPaused() const { return impl_->isPaused(); }

const DownloadMetadata& TransferSession::metadata() const noexcept { return impl_->metadata(); }

} // namespace httpdl
