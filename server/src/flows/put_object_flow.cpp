#include "flows/put_object_flow.hpp"
#include "session.hpp"

#include "uplink/errors.hpp"
#include "uplink/helpers.hpp"
#include "uplink/log.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

PutObjectFlow::PutObjectFlow(Session *s, AdmittedPut put) : Flow(s), put(std::move(put)) {
    this->bytes_remaining = this->put.size;
    this->part_path = this->put.target;
    this->part_path += ".part";

    std::filesystem::create_directories(this->put.target.parent_path());
    this->out.open(this->part_path, std::ios::binary | std::ios::trunc);
    if (!this->out.is_open()) {
        throw std::runtime_error("file_open_failed: Could not open object for writing (path: " + this->part_path.string() + ")");
    }

    // prepare to receive object
    this->session->send(nlohmann::json{{"status", 100}}.dump());
    if (this->bytes_remaining == 0) {
        this->finish();
    }
}

PutObjectFlow::~PutObjectFlow() {
    if (!this->done) {
        // connection dropped mid-object, nothing partial stays behind
        this->out.close();
        std::error_code ec;
        std::filesystem::remove(this->part_path, ec);
        uplink::log_warning("[put] incomplete upload of ", this->put.object_key, " discarded");
    }
}

void PutObjectFlow::onReadable() {
    std::vector<char> buffer(std::min<std::uint64_t>(this->bytes_remaining, uplink::TMP_BUFF_SIZE));
    ssize_t n = ::recv(this->session->getClientFD(), buffer.data(), buffer.size(), 0);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return;
        }
        throw std::runtime_error("recv: " + std::string(std::strerror(errno)));
    }
    if (n == 0) {
        throw uplink::TransientNetworkError("connection_closed: Client closed the connection mid-object");
    }
    this->out.write(buffer.data(), n);
    if (!this->out) {
        throw std::runtime_error("file_write_failed: Could not write object (path: " + this->part_path.string() + ")");
    }
    this->digest.update(buffer.data(), static_cast<std::size_t>(n));
    this->bytes_remaining -= static_cast<std::uint64_t>(n);

    if (this->bytes_remaining == 0) { // object received -> leave flow
        this->finish();
    }
}

void PutObjectFlow::finish() {
    this->out.close();
    this->done = true;
    std::string actual = this->digest.hex();
    if (!this->put.content_hash.empty() && actual != this->put.content_hash) {
        std::filesystem::remove(this->part_path);
        uplink::log_warning("[put] hash mismatch for ", this->put.object_key);
        this->session->send(nlohmann::json{
            {"status", 400},
            {"error", "hash_mismatch: Content hash does not match (expected " + this->put.content_hash + ", got " + actual + ")"},
        }.dump());
    } else {
        std::filesystem::rename(this->part_path, this->put.target);
        uplink::log_info("[put] stored ", this->put.object_key, " (", this->put.size, " bytes)");
        this->session->send(nlohmann::json{
            {"status", 201},
            {"objectKey", this->put.object_key},
            {"size", this->put.size},
            {"contentHash", actual},
        }.dump());
    }
    this->session->leaveFlow();
}
