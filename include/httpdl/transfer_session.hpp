#pragma once

#include "download_state.hpp"
#include "http_client.hpp"
#include "transfer_config.hpp"

#include <cstdint>
#include <memory>

namespace httpdl {

// Runtime state of one download and the worker that moves its bytes.
//
// The session is the only writer of its state. Every run appends to the
// destination file from the current byte count, so the file length at rest
// is the resume cursor. Readers get whole-state copies taken under the
// session's lock.
class TransferSession {
public:
    TransferSession(DownloadMetadata metadata, HttpClientPtr client, SessionOptions options = {});
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Begins or resumes the transfer on a worker thread. Valid from Created,
    // Paused and Error (explicit retry); throws DownloadError(invalid_transition)
    // otherwise. A partial file whose length differs from the recorded byte
    // count moves the session to Error without any network traffic; one that
    // already holds every announced byte completes without a request.
    void start();

    // Asks the worker to stop after the current chunk and waits until the
    // file is flushed and Paused is published. No-op when already paused.
    void pause();

    // Stops the worker without a transition check. Used for teardown.
    void cancel();

    // Blocks until the current run, if any, has ended.
    void wait();

    [[nodiscard]] DownloadState state() const;
    [[nodiscard]] std::uint64_t bytesDownloaded() const;
    [[nodiscard]] bool isActive() const;
    // True only after a run was paused; a session that never started is not.
    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] const DownloadMetadata& metadata() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using TransferSessionPtr = std::shared_ptr<TransferSession>;

} // namespace httpdl
