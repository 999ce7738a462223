#pragma once

#include "uplink/backend.hpp"
#include "uplink/config.hpp"
#include "uplink/errors.hpp"
#include "uplink/hasher.hpp"
#include "uplink/transport.hpp"

#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace uplink::fakes {

// config with millisecond backoff so retry paths run fast
inline UploadConfig fast_config() {
    UploadConfig config;
    config.retry_attempts = 3;
    config.retry_delay_base_ms = 1;
    config.retry_delay_max_ms = 5;
    config.stall_check_interval_ms = 20;
    config.stall_threshold_seconds = 1;
    return config;
}

// unique scratch directory removed on destruction
class TempDir {
public:
    TempDir() : dir(std::filesystem::temp_directory_path() / ("uplink-test-" + random_hex(8))) {
        std::filesystem::create_directories(this->dir);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(this->dir, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return this->dir; }

    std::filesystem::path writeFile(const std::string &name, std::size_t size, char fill = 'x') const {
        std::filesystem::path p = this->dir / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << std::string(size, fill);
        return p;
    }

private:
    std::filesystem::path dir;
};

using PutBehavior = std::function<TransferResponse(const TransferRequest &, const BytesCallback &, CancelToken &)>;

// reports the whole file in 4 steps and answers 201
inline TransferResponse stream_ok(const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &) {
    std::uint64_t step = request.size / 4 == 0 ? request.size : request.size / 4;
    for (std::uint64_t sent = step; sent < request.size; sent += step) {
        on_bytes(sent);
    }
    on_bytes(request.size);
    return TransferResponse{201, ""};
}

inline PutBehavior respond_with(int status, const std::string &message = "") {
    return [status, message](const TransferRequest &, const BytesCallback &, CancelToken &) {
        return TransferResponse{status, message};
    };
}

inline PutBehavior throw_transient(const std::string &message = "connection: reset by peer") {
    return [message](const TransferRequest &, const BytesCallback &, CancelToken &) -> TransferResponse {
        throw TransientNetworkError(message);
    };
}

// sends half the file then waits until cancelled
inline PutBehavior block_until_cancel() {
    return [](const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &cancel) -> TransferResponse {
        on_bytes(request.size / 2);
        while (!cancel.cancelled()) {
            cancel.waitFor(std::chrono::milliseconds(5));
        }
        throw CancelledError();
    };
}

// scripted object store: behaviors are consumed per file name, then `fallback`
class FakeTransport : public ObjectTransport {
public:
    TransferResponse put(const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &cancel) override {
        PutBehavior behavior = this->fallback;
        std::string name = request.local_path.filename().string();
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            this->requests.push_back(request);
            auto it = this->scripts.find(name);
            if (it != this->scripts.end() && !it->second.empty()) {
                behavior = it->second.front();
                it->second.pop_front();
            }
        }
        int now_active = ++this->active;
        int seen = this->max_active.load();
        while (now_active > seen && !this->max_active.compare_exchange_weak(seen, now_active)) {
        }
        struct Leave {
            std::atomic<int> &active;
            ~Leave() { --active; }
        } leave{this->active};
        if (this->hold.count() > 0) {
            std::this_thread::sleep_for(this->hold);
        }
        return behavior(request, on_bytes, cancel);
    }

    void script(const std::string &file_name, std::vector<PutBehavior> behaviors) {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto &b : behaviors) {
            this->scripts[file_name].push_back(std::move(b));
        }
    }

    std::size_t callCount() const {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->requests.size();
    }

    std::size_t callsFor(const std::string &file_name) const {
        std::lock_guard<std::mutex> lock(this->mutex);
        std::size_t n = 0;
        for (const auto &r : this->requests) {
            if (r.local_path.filename().string() == file_name) {
                n++;
            }
        }
        return n;
    }

    std::vector<TransferRequest> allRequests() const {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->requests;
    }

    PutBehavior fallback = stream_ok;
    std::chrono::milliseconds hold{0}; // time each put occupies a slot
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

private:
    mutable std::mutex mutex;
    std::map<std::string, std::deque<PutBehavior>> scripts;
    std::vector<TransferRequest> requests;
};

class FakeHasher : public ContentHasher {
public:
    std::string hashFile(const std::filesystem::path &path) override {
        this->calls++;
        return "hash-" + path.filename().string();
    }

    std::atomic<int> calls{0};
};

class FakeRecordClient : public RecordClient {
public:
    std::vector<std::string> createPending(const std::string &batch_id, const std::vector<FileUploadTask> &files) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->calls++;
        this->last_batch_id = batch_id;
        std::vector<std::string> ids;
        for (std::size_t i = 0; i < files.size(); ++i) {
            ids.push_back("rec-" + std::to_string(this->next_id++));
        }
        return ids;
    }

    std::mutex mutex;
    int calls = 0;
    int next_id = 1;
    std::string last_batch_id;
};

class FakeAuthorizationClient : public AuthorizationClient {
public:
    AuthorizationMap authorize(const std::string &, const std::vector<std::string> &record_ids, int) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->calls++;
        this->request_sizes.push_back(record_ids.size());
        if (this->fail_requests > 0) {
            this->fail_requests--;
            throw TransientNetworkError("http_503: Authorization service unavailable", 503);
        }
        AuthorizationMap result;
        for (const auto &id : record_ids) {
            auto refused = this->refuse.find(id);
            if (refused != this->refuse.end()) {
                result[id].error = refused->second;
                continue;
            }
            Authorization auth;
            auth.record_id = id;
            auth.object_key = "objects/" + id;
            auth.upload_url = "tcp://127.0.0.1:9/objects/" + id;
            auth.auth_token = "token-" + std::to_string(this->calls) + "-" + id;
            auth.content_type = "application/octet-stream";
            auth.expires_in_seconds = 3600;
            result[id].authorization = auth;
        }
        return result;
    }

    std::mutex mutex;
    int calls = 0;
    int fail_requests = 0;
    std::vector<std::size_t> request_sizes;
    std::map<std::string, std::string> refuse; // record id -> reason
};

class FakeFinalizeClient : public FinalizeClient {
public:
    FinalizeResult finalize(const std::string &record_id, std::uint64_t file_size_bytes, double duration_seconds) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->calls[record_id]++;
        if (this->transient_failures > 0) {
            this->transient_failures--;
            throw TransientNetworkError("http_502: Bad gateway", 502);
        }
        if (this->reject.count(record_id) > 0) {
            throw NonRetryableClientError("not_found: Record does not exist", 404);
        }
        FinalizeResult result;
        result.file_size_bytes = file_size_bytes;
        result.duration_seconds = duration_seconds;
        return result;
    }

    int callsFor(const std::string &record_id) {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->calls[record_id];
    }

    std::mutex mutex;
    std::map<std::string, int> calls;
    int transient_failures = 0;
    std::set<std::string> reject;
};

// answers backend calls from a canned handler and records what was sent
class FakeRpcChannel : public RpcChannel {
public:
    using Handler = std::function<nlohmann::json(const std::string &, const nlohmann::json &)>;

    explicit FakeRpcChannel(Handler handler) : handler(std::move(handler)) {}

    nlohmann::json call(const std::string &op, const nlohmann::json &params) override {
        this->ops.push_back(op);
        this->sent.push_back(params);
        nlohmann::json response = this->handler(op, params);
        check_response(response);
        return response;
    }

    std::vector<std::string> ops;
    std::vector<nlohmann::json> sent;

private:
    Handler handler;
};

} // namespace uplink::fakes
