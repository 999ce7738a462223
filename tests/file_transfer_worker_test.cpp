#include "uplink/file_transfer_worker.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

using namespace uplink;
using namespace uplink::fakes;

namespace {

class FileTransferWorkerTest : public ::testing::Test {
protected:
    FileTransferWorkerTest() : config(fast_config()), policy(config, monitor) {}

    FileUploadTask makeTask(const std::string &name, std::size_t size = 4096) {
        FileUploadTask task;
        task.file_name = name;
        task.local_path = this->dir.writeFile(name, size);
        task.file_size_bytes = size;
        task.record_id = "rec-" + name;
        return task;
    }

    Authorization makeAuth(const std::string &token = "token-1") {
        Authorization auth;
        auth.record_id = "rec";
        auth.object_key = "b/rec";
        auth.upload_url = "tcp://127.0.0.1:9/b/rec";
        auth.auth_token = token;
        return auth;
    }

    // records every callback for later inspection
    TaskCallback recorder() {
        return [this](const FileUploadTask &task, bool byte_update) {
            std::lock_guard<std::mutex> lock(this->events_mutex);
            this->events.push_back({task, byte_update});
        };
    }

    std::vector<UploadStatus> statusTrail() {
        std::lock_guard<std::mutex> lock(this->events_mutex);
        std::vector<UploadStatus> trail;
        for (const auto &e : this->events) {
            if (!e.second && (trail.empty() || trail.back() != e.first.status)) {
                trail.push_back(e.first.status);
            }
        }
        return trail;
    }

    TempDir dir;
    UploadConfig config;
    NetworkMonitor monitor;
    RetryPolicy policy;
    FakeTransport transport;
    FakeHasher hasher;
    CancelToken cancel;
    std::mutex events_mutex;
    std::vector<std::pair<FileUploadTask, bool>> events;
};

} // namespace

TEST_F(FileTransferWorkerTest, UploadsOnFirstAttempt) {
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(result.uploaded_bytes, 4096u);
    EXPECT_EQ(result.retry_count, 0);
    EXPECT_EQ(result.remote_object_key, "b/rec");
    EXPECT_EQ(transport.callCount(), 1u);
    EXPECT_EQ(transport.allRequests()[0].content_hash, "hash-a.bin");
    EXPECT_EQ(statusTrail(), (std::vector<UploadStatus>{UploadStatus::Uploading, UploadStatus::Completed}));

    std::uint64_t last = 0;
    int byte_events = 0;
    for (const auto &e : events) {
        if (e.second) {
            EXPECT_GT(e.first.uploaded_bytes, last);
            last = e.first.uploaded_bytes;
            byte_events++;
        }
    }
    EXPECT_EQ(byte_events, 4);
}

TEST_F(FileTransferWorkerTest, RetriesTransientFailuresThenSucceeds) {
    transport.script("a.bin", {throw_transient(), respond_with(503, "Service unavailable")});
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(result.retry_count, 2);
    EXPECT_EQ(transport.callCount(), 3u);
    EXPECT_EQ(hasher.calls.load(), 1);
    EXPECT_TRUE(result.retry_log.empty());
    auto trail = statusTrail();
    EXPECT_NE(std::find(trail.begin(), trail.end(), UploadStatus::Retrying), trail.end());
    EXPECT_EQ(trail.back(), UploadStatus::Completed);

    // the log grows by one entry per failed attempt until success clears it
    std::vector<std::deque<RetryAttempt>> logs;
    for (const auto &e : events) {
        if (!e.second && e.first.status == UploadStatus::Retrying) {
            logs.push_back(e.first.retry_log);
        }
    }
    ASSERT_FALSE(logs.empty());
    EXPECT_EQ(logs.front().size(), 1u);
    ASSERT_EQ(logs.back().size(), 2u);
    EXPECT_EQ(logs.back()[0].attempt_number, 1);
    EXPECT_EQ(logs.back()[1].attempt_number, 2);
    EXPECT_TRUE(logs.back()[0].will_retry);
    EXPECT_TRUE(logs.back()[1].will_retry);
}

TEST_F(FileTransferWorkerTest, ClientErrorFailsWithoutRetry) {
    transport.script("a.bin", {respond_with(400, "Bad request")});
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(result.retry_count, 0);
    EXPECT_EQ(transport.callCount(), 1u);
    EXPECT_EQ(result.error.rfind("http_400", 0), 0u);
    ASSERT_EQ(result.retry_log.size(), 1u);
    EXPECT_FALSE(result.retry_log[0].will_retry);
    EXPECT_EQ(result.retry_log[0].error_class, ErrorClass::NonRetryableClient);
}

TEST_F(FileTransferWorkerTest, ForbiddenIsNeverRetried) {
    transport.fallback = respond_with(403, "Forbidden");
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(FileTransferWorkerTest, GivesUpAfterConfiguredRetries) {
    transport.fallback = throw_transient();
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(result.retry_count, 3);
    EXPECT_EQ(transport.callCount(), 4u);
    ASSERT_EQ(result.retry_log.size(), 4u);
    EXPECT_TRUE(result.retry_log[0].will_retry);
    EXPECT_FALSE(result.retry_log.back().will_retry);
    EXPECT_EQ(result.retry_log.back().attempt_number, 4);
}

TEST_F(FileTransferWorkerTest, OfflineFailsFastWithoutTouchingTheNetwork) {
    monitor.setOnline(false);
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(result.error.rfind("offline", 0), 0u);
    EXPECT_EQ(transport.callCount(), 0u);
}

TEST_F(FileTransferWorkerTest, GoingOfflineStopsRetrying) {
    transport.fallback = [this](const TransferRequest &, const BytesCallback &, CancelToken &) -> TransferResponse {
        this->monitor.setOnline(false);
        throw TransientNetworkError("connection: Network is unreachable");
    };
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(transport.callCount(), 1u);
    EXPECT_NE(result.error.find("offline: Network went offline"), std::string::npos);
    EXPECT_NE(result.error.find("Network is unreachable"), std::string::npos);
}

TEST_F(FileTransferWorkerTest, CancelAbortsInFlightTransfer) {
    transport.fallback = block_until_cancel();
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    std::thread canceller([this] {
        while (this->transport.callCount() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        this->cancel.cancel();
    });
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);
    canceller.join();

    EXPECT_EQ(result.status, UploadStatus::Aborted);
    EXPECT_EQ(result.retry_count, 0);
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(FileTransferWorkerTest, CancelledBeforeStartNeverTransfers) {
    cancel.cancel();
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Aborted);
    EXPECT_EQ(result.uploaded_bytes, 0u);
    EXPECT_EQ(transport.callCount(), 0u);
}

TEST_F(FileTransferWorkerTest, ExpiredTokenIsRefreshedAndRetried) {
    transport.script("a.bin", {respond_with(401, "Token expired")});
    int refreshes = 0;
    FileTransferWorker worker(config, monitor, hasher, transport, policy, [&](const FileUploadTask &) {
        refreshes++;
        return makeAuth("token-2");
    });
    auto result = worker.upload(makeTask("a.bin"), makeAuth("token-1"), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(result.retry_count, 1);
    auto requests = transport.allRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].authorization.auth_token, "token-1");
    EXPECT_EQ(requests[1].authorization.auth_token, "token-2");
}

TEST_F(FileTransferWorkerTest, TransientRefreshFailureIsRetried) {
    transport.script("a.bin", {respond_with(401, "Token expired")});
    int refreshes = 0;
    FileTransferWorker worker(config, monitor, hasher, transport, policy, [&](const FileUploadTask &) {
        if (++refreshes == 1) {
            throw TransientNetworkError("http_503: Authorization backend busy", 503);
        }
        return makeAuth("token-3");
    });
    auto result = worker.upload(makeTask("a.bin"), makeAuth("token-1"), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_EQ(refreshes, 2);
    EXPECT_EQ(result.retry_count, 2);
    auto requests = transport.allRequests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].authorization.auth_token, "token-3");
}

TEST_F(FileTransferWorkerTest, RefreshFailuresStopAtRetryBudget) {
    transport.script("a.bin", {respond_with(401, "Token expired")});
    int refreshes = 0;
    FileTransferWorker worker(config, monitor, hasher, transport, policy, [&](const FileUploadTask &) -> Authorization {
        refreshes++;
        throw TransientNetworkError("http_503: Authorization backend busy", 503);
    });
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(result.retry_count, 3);
    EXPECT_EQ(refreshes, 3);
    EXPECT_EQ(transport.callCount(), 1u);
    EXPECT_EQ(result.error.rfind("http_503", 0), 0u);
}

TEST_F(FileTransferWorkerTest, RefusedRefreshFailsImmediately) {
    transport.script("a.bin", {respond_with(401, "Token expired")});
    int refreshes = 0;
    FileTransferWorker worker(config, monitor, hasher, transport, policy, [&](const FileUploadTask &) -> Authorization {
        refreshes++;
        throw AuthorizationError("authorization_failed: forbidden");
    });
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(result.error, "authorization_failed: forbidden");
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(FileTransferWorkerTest, ExpiredTokenWithoutRefresherFails) {
    transport.script("a.bin", {respond_with(401, "Token expired")});
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(transport.callCount(), 1u);
}

TEST_F(FileTransferWorkerTest, RetryProgressNeverMovesBackwards) {
    transport.script("a.bin", {[](const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &) -> TransferResponse {
        on_bytes(request.size / 2);
        throw TransientNetworkError("connection: reset by peer");
    }});
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    std::uint64_t high = 0;
    for (const auto &e : events) {
        EXPECT_GE(e.first.uploaded_bytes, high);
        high = std::max(high, e.first.uploaded_bytes);
    }
    EXPECT_EQ(high, 4096u);
}

TEST_F(FileTransferWorkerTest, LongSilenceIsReportedAsStall) {
    transport.fallback = [](const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &) {
        on_bytes(request.size / 4);
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        on_bytes(request.size);
        return TransferResponse{201, ""};
    };
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Completed);
    EXPECT_FALSE(result.is_stalled);
    bool saw_stall = false;
    for (const auto &e : events) {
        saw_stall = saw_stall || e.first.is_stalled;
    }
    EXPECT_TRUE(saw_stall);
}

TEST_F(FileTransferWorkerTest, ResumedProgressClearsStallBelowHighWaterMark) {
    transport.script("a.bin", {[](const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &) -> TransferResponse {
        on_bytes(request.size / 2);
        throw TransientNetworkError("connection: reset by peer");
    }});
    transport.fallback = [](const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &) {
        on_bytes(request.size / 8);
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        on_bytes(request.size / 4);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        on_bytes(request.size);
        return TransferResponse{201, ""};
    };
    FileTransferWorker worker(config, monitor, hasher, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);
    ASSERT_EQ(result.status, UploadStatus::Completed);

    std::lock_guard<std::mutex> lock(events_mutex);
    auto stalled = std::find_if(events.begin(), events.end(), [](const auto &e) { return e.first.is_stalled; });
    ASSERT_NE(stalled, events.end());
    auto cleared = std::find_if(stalled, events.end(), [](const auto &e) {
        return !e.second && !e.first.is_stalled && e.first.status == UploadStatus::Uploading;
    });
    ASSERT_NE(cleared, events.end());
    EXPECT_EQ(cleared->first.uploaded_bytes, 2048u);
}

TEST_F(FileTransferWorkerTest, UnreadableFileIsNotRetried) {
    struct ThrowingHasher : ContentHasher {
        std::string hashFile(const std::filesystem::path &) override { throw std::runtime_error("file_open_failed: gone"); }
    } broken;
    FileTransferWorker worker(config, monitor, broken, transport, policy);
    auto result = worker.upload(makeTask("a.bin"), makeAuth(), recorder(), cancel);

    EXPECT_EQ(result.status, UploadStatus::Failed);
    EXPECT_EQ(result.error.rfind("hash_failed", 0), 0u);
    EXPECT_EQ(transport.callCount(), 0u);
}

TEST(FileTransferTimeoutTest, ScalesWithSizeAboveFloor) {
    EXPECT_EQ(FileTransferWorker::transferTimeout(1024 * 1024, 120000), MIN_TRANSFER_TIMEOUT);
    EXPECT_EQ(FileTransferWorker::transferTimeout(10 * 1024 * 1024, 120000).count(), 1200000);
}
