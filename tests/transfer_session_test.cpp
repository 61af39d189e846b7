#include <gtest/gtest.h>

#include "fake_http_client.hpp"
#include "test_support.hpp"

#include <httpdl/error.hpp>
#include <httpdl/transfer_session.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace httpdl;
using namespace httpdl::test;

namespace {

constexpr const char* kUrl = "http://files.example.test/payload.bin";

} // namespace

class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeHttpClient>();
        body_ = makeBody(1000);
    }

    std::unique_ptr<TransferSession> makeSession(std::uint64_t content_length,
                                                 const std::string& name = "payload.bin",
                                                 SessionOptions options = {}) {
        DownloadMetadata metadata;
        metadata.id = newDownloadId();
        metadata.url = kUrl;
        metadata.file_path = (dir_.path() / name).string();
        metadata.content_length = content_length;
        return std::make_unique<TransferSession>(metadata, client_, std::move(options));
    }

    void serve(FakeHttpClient::Resource resource) {
        if (resource.body.empty()) {
            resource.body = body_;
        }
        client_->add(kUrl, std::move(resource));
    }

    TempDir dir_;
    std::shared_ptr<FakeHttpClient> client_;
    std::string body_;
};

TEST_F(TransferSessionTest, DownloadsWholeBodyAndCompletes) {
    serve({});
    auto session = makeSession(body_.size());

    session->start();
    session->wait();

    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
    EXPECT_EQ(session->bytesDownloaded(), body_.size());
    EXPECT_EQ(readFile(session->metadata().file_path), body_);

    const auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].offset, 0u);
}

TEST_F(TransferSessionTest, ByteCountIsMonotonicAndBoundedByContentLength) {
    FakeHttpClient::Resource resource;
    resource.chunk_size = 7;
    resource.chunk_delay = std::chrono::microseconds(50);
    serve(resource);
    auto session = makeSession(body_.size());

    std::atomic<bool> done{false};
    std::vector<std::uint64_t> observed;
    std::thread reader([&] {
        while (!done) {
            const auto state = session->state();
            if (const auto bytes = bytesDownloaded(state)) {
                observed.push_back(*bytes);
            }
        }
    });

    session->start();
    session->wait();
    done = true;
    reader.join();

    ASSERT_FALSE(observed.empty());
    for (std::size_t i = 1; i < observed.size(); ++i) {
        EXPECT_LE(observed[i - 1], observed[i]);
    }
    for (const auto bytes : observed) {
        EXPECT_LE(bytes, body_.size());
    }
    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
}

TEST_F(TransferSessionTest, ServerSendingMoreThanAnnouncedFails) {
    FakeHttpClient::Resource resource;
    resource.announced_length = 500;
    serve(resource);
    auto session = makeSession(500);

    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, Errc::network_error);
    EXPECT_LE(session->bytesDownloaded(), 500u);
    EXPECT_EQ(std::filesystem::file_size(session->metadata().file_path), 500u);
}

TEST_F(TransferSessionTest, EarlyCloseEndsInIncompleteTransfer) {
    FakeHttpClient::Resource resource;
    resource.close_after = 600;
    serve(resource);
    auto session = makeSession(1000);

    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->error, "incomplete transfer");
    EXPECT_EQ(error->code, Errc::incomplete_transfer);
    EXPECT_EQ(std::filesystem::file_size(session->metadata().file_path), 600u);
}

TEST_F(TransferSessionTest, RetryAfterIncompleteTransferResumesFromPartialFile) {
    FakeHttpClient::Resource resource;
    resource.close_after = 600;
    serve(resource);
    auto session = makeSession(1000);

    session->start();
    session->wait();
    ASSERT_TRUE(std::holds_alternative<state::Error>(session->state()));

    client_->update(kUrl, [](FakeHttpClient::Resource& r) { r.close_after.reset(); });
    session->start();
    session->wait();

    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
    EXPECT_EQ(readFile(session->metadata().file_path), body_);
    const auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].offset, 600u);
}

TEST_F(TransferSessionTest, PauseAndResumeMatchesUninterruptedDownload) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 300;
    serve(resource);
    auto session = makeSession(body_.size(), "paused.bin");

    session->start();
    ASSERT_TRUE(waitFor([&] { return session->bytesDownloaded() == 300; }));
    session->pause();

    const auto paused = session->state();
    ASSERT_TRUE(std::holds_alternative<state::Paused>(paused));
    EXPECT_EQ(std::get<state::Paused>(paused).bytes_downloaded, 300u);
    EXPECT_EQ(std::filesystem::file_size(session->metadata().file_path), 300u);

    session->start();
    session->wait();
    ASSERT_TRUE(std::holds_alternative<state::Complete>(session->state()));

    const auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].offset, 300u);

    client_->update(kUrl, [](FakeHttpClient::Resource& r) { r.stall_at.reset(); });
    auto reference = makeSession(body_.size(), "straight.bin");
    reference->start();
    reference->wait();

    EXPECT_EQ(readFile(session->metadata().file_path), readFile(reference->metadata().file_path));
    EXPECT_EQ(readFile(session->metadata().file_path), body_);
}

TEST_F(TransferSessionTest, PauseAfterLastByteCompletes) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 1000;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    ASSERT_TRUE(waitFor([&] { return session->bytesDownloaded() == 1000; }));
    session->pause();

    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
    EXPECT_EQ(readFile(session->metadata().file_path), body_);
    try {
        session->start();
        FAIL() << "start on a complete download must throw";
    } catch (const DownloadError& e) {
        EXPECT_EQ(e.errc(), Errc::invalid_transition);
    }
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(TransferSessionTest, RetryWithWholeFileCompletesWithoutRequest) {
    FakeHttpClient::Resource resource;
    resource.reset_after_body = true;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    session->wait();
    ASSERT_TRUE(std::holds_alternative<state::Error>(session->state()));
    ASSERT_EQ(session->bytesDownloaded(), body_.size());

    session->start();
    session->wait();

    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
    EXPECT_EQ(readFile(session->metadata().file_path), body_);
    EXPECT_EQ(client_->requests().size(), 1u);
}

TEST_F(TransferSessionTest, NeverStartedSessionIsNotPaused) {
    serve({});
    auto session = makeSession(body_.size());
    EXPECT_FALSE(session->isPaused());
    EXPECT_FALSE(session->isActive());
}

TEST_F(TransferSessionTest, PauseIsIdempotent) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 200;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    ASSERT_TRUE(waitFor([&] { return session->bytesDownloaded() == 200; }));
    session->pause();
    EXPECT_NO_THROW(session->pause());

    const auto state = session->state();
    ASSERT_TRUE(std::holds_alternative<state::Paused>(state));
    EXPECT_EQ(std::get<state::Paused>(state).bytes_downloaded, 200u);
}

TEST_F(TransferSessionTest, PauseAfterCompletionIsInvalid) {
    serve({});
    auto session = makeSession(body_.size());
    session->start();
    session->wait();

    try {
        session->pause();
        FAIL() << "pause on a complete download must throw";
    } catch (const DownloadError& e) {
        EXPECT_EQ(e.errc(), Errc::invalid_transition);
    }
    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
}

TEST_F(TransferSessionTest, StartWhileRunningIsInvalid) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 100;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    try {
        session->start();
        FAIL() << "start on a running download must throw";
    } catch (const DownloadError& e) {
        EXPECT_EQ(e.errc(), Errc::invalid_transition);
    }
    session->pause();
}

TEST_F(TransferSessionTest, StartAfterCompletionIsInvalid) {
    serve({});
    auto session = makeSession(body_.size());
    session->start();
    session->wait();

    EXPECT_THROW(session->start(), DownloadError);
}

TEST_F(TransferSessionTest, ResumeRejectsPartialFileWithWrongLength) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 250;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    ASSERT_TRUE(waitFor([&] { return session->bytesDownloaded() == 250; }));
    session->pause();

    appendToFile(session->metadata().file_path, std::string(50, 'x'));
    ASSERT_EQ(std::filesystem::file_size(session->metadata().file_path), 300u);

    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, Errc::io_error);
    EXPECT_NE(error->error.find("mismatch"), std::string::npos);
    // no resume request went out
    EXPECT_EQ(client_->requests().size(), 1u);
    EXPECT_EQ(std::filesystem::file_size(session->metadata().file_path), 300u);
}

TEST_F(TransferSessionTest, ResumeRejectsMissingPartialFile) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 250;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    ASSERT_TRUE(waitFor([&] { return session->bytesDownloaded() == 250; }));
    session->pause();
    std::filesystem::remove(session->metadata().file_path);

    session->start();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, Errc::io_error);
}

TEST_F(TransferSessionTest, ResumeFailsWhenServerIgnoresRange) {
    FakeHttpClient::Resource resource;
    resource.stall_at = 300;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    ASSERT_TRUE(waitFor([&] { return session->bytesDownloaded() == 300; }));
    session->pause();

    client_->update(kUrl, [](FakeHttpClient::Resource& r) { r.honor_ranges = false; });
    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->error, "range not satisfiable");
    EXPECT_EQ(error->code, Errc::range_not_satisfiable);
    EXPECT_EQ(std::filesystem::file_size(session->metadata().file_path), 300u);
}

TEST_F(TransferSessionTest, UnknownLengthCompletesAtEndOfStream) {
    FakeHttpClient::Resource resource;
    resource.announce_length = false;
    resource.close_after = 700;
    serve(resource);
    auto session = makeSession(0);

    session->start();
    session->wait();

    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
    EXPECT_EQ(std::filesystem::file_size(session->metadata().file_path), 700u);
}

TEST_F(TransferSessionTest, HttpErrorStatusBecomesErrorState) {
    FakeHttpClient::Resource resource;
    resource.status = 404;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, Errc::network_error);
    EXPECT_NE(error->error.find("404"), std::string::npos);
}

TEST_F(TransferSessionTest, TransportFailureBecomesErrorState) {
    FakeHttpClient::Resource resource;
    resource.fail_fetch = true;
    serve(resource);
    auto session = makeSession(body_.size());

    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, Errc::network_error);
    EXPECT_NE(error->error.find("connection reset"), std::string::npos);
}

TEST_F(TransferSessionTest, UnwritableDestinationBecomesIoError) {
    serve({});
    auto session = makeSession(body_.size(), "missing-dir/payload.bin");

    session->start();
    session->wait();

    const auto state = session->state();
    const auto* error = std::get_if<state::Error>(&state);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->code, Errc::io_error);
}

TEST_F(TransferSessionTest, SnapshotsPairBytesWithTheirOwnRate) {
    FakeHttpClient::Resource resource;
    resource.body = makeBody(10000);
    resource.chunk_delay = std::chrono::microseconds(100);
    serve(resource);

    // every clock read advances 100 ms, every chunk adds 100 bytes: 1000 B/s
    auto ticks = std::make_shared<std::atomic<int>>(0);
    SessionOptions options;
    options.clock = [ticks] {
        return RateTracker::TimePoint{} + std::chrono::milliseconds(100) * ticks->fetch_add(1);
    };
    auto session = makeSession(10000, "rate.bin", options);

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> seen{0};
    std::thread reader([&] {
        while (!done) {
            const auto state = session->state();
            if (const auto* running = std::get_if<state::Running>(&state)) {
                if (running->bytes_downloaded > 0) {
                    ++seen;
                    if (running->bytes_per_second != 1000) {
                        ++torn;
                    }
                }
            }
        }
    });

    session->start();
    session->wait();
    done = true;
    reader.join();

    EXPECT_TRUE(std::holds_alternative<state::Complete>(session->state()));
    EXPECT_GT(seen.load(), 0);
    EXPECT_EQ(torn.load(), 0);
}
