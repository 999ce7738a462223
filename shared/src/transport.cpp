#include "uplink/transport.hpp"
#include "uplink/errors.hpp"
#include "uplink/log.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink {

namespace {

// lets the cancel callback shut the socket down without racing its close
struct AbortableSocket {
    std::mutex mutex;
    int fd = -1;
    bool aborted = false;

    void abort() {
        std::lock_guard<std::mutex> lock(mutex);
        aborted = true;
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex);
        fd = -1;
    }

    bool wasAborted() {
        std::lock_guard<std::mutex> lock(mutex);
        return aborted;
    }
};

// detaches before the owning ScopedFd closes the descriptor
struct DetachGuard {
    std::shared_ptr<AbortableSocket> socket;
    ~DetachGuard() { socket->detach(); }
};

TransferResponse parse_status(const std::string &raw) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error &e) {
        throw TransientNetworkError("bad_response: Object store sent malformed JSON: " + std::string(e.what()));
    }
    TransferResponse response;
    response.status = doc.value("status", 0);
    response.message = doc.value("error", doc.value("message", std::string()));
    return response;
}

} // namespace

TransferResponse SocketTransport::put(const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &cancel) {
    UploadUrl url = parse_upload_url(request.authorization.upload_url);
    Deadline deadline = Clock::now() + request.timeout;

    std::ifstream infile(request.local_path, std::ios::binary);
    if (!infile) {
        throw NonRetryableClientError("file_open_failed: Failed to open file for reading (path: " + request.local_path.string() + ")");
    }

    if (cancel.cancelled()) {
        throw CancelledError();
    }

    log_debug("put ", url.object_key, " (", request.size, " bytes) to ", url.endpoint.host, ":", url.endpoint.port);
    ScopedFd sock(connect_to(url.endpoint, deadline));
    auto abortable = std::make_shared<AbortableSocket>();
    abortable->fd = sock.get();
    DetachGuard detach_guard{abortable};
    CancelRegistration registration(cancel, [abortable] { abortable->abort(); });

    try {
        nlohmann::json header = {
            {"op", "put_object"},
            {"objectKey", url.object_key},
            {"authToken", request.authorization.auth_token},
            {"contentType", request.authorization.content_type},
            {"contentHash", request.content_hash},
            {"size", request.size},
        };
        send_msg(sock.get(), header.dump(), deadline);

        // store answers 100 to go ahead, or an error status straight away
        TransferResponse ready = parse_status(recv_msg(sock.get(), deadline));
        if (ready.status != 100) {
            return ready;
        }

        std::vector<char> buffer(TMP_BUFF_SIZE);
        std::uint64_t sent = 0;
        while (sent < request.size) {
            if (cancel.cancelled()) {
                throw CancelledError();
            }
            std::uint64_t left = request.size - sent;
            std::size_t to_read = static_cast<std::size_t>(std::min<std::uint64_t>(left, buffer.size()));
            infile.read(buffer.data(), static_cast<std::streamsize>(to_read));
            std::streamsize read_bytes = infile.gcount();
            if (read_bytes <= 0) {
                throw NonRetryableClientError("file_read_failed: File shrank while uploading (path: " + request.local_path.string() + ")");
            }
            send_all(sock.get(), buffer.data(), static_cast<std::size_t>(read_bytes), deadline);
            sent += static_cast<std::uint64_t>(read_bytes);
            if (on_bytes) {
                on_bytes(sent);
            }
        }

        return parse_status(recv_msg(sock.get(), deadline));
    } catch (const UploadError &e) {
        if (abortable->wasAborted() && e.errorClass() != ErrorClass::Cancelled) {
            throw CancelledError();
        }
        throw;
    }
}

} // namespace uplink
