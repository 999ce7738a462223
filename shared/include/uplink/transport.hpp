#pragma once

#include "uplink/cancel_token.hpp"
#include "uplink/helpers.hpp"
#include "uplink/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace uplink {

struct TransferRequest {
    std::filesystem::path local_path;
    std::uint64_t size = 0;
    Authorization authorization;
    std::string content_hash;
    std::chrono::milliseconds timeout{0};
};

struct TransferResponse {
    int status = 0; // HTTP-equivalent
    std::string message;

    bool ok() const { return status >= 200 && status < 300; }
};

// receives the cumulative number of bytes sent in the current attempt
using BytesCallback = std::function<void(std::uint64_t)>;

class ObjectTransport {
public:
    virtual ~ObjectTransport() = default;

    // single streaming write of the file; throws TransientNetworkError for
    // socket-level failures and CancelledError once cancel fires
    virtual TransferResponse put(const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &cancel) = 0;
};

class SocketTransport : public ObjectTransport {
public:
    TransferResponse put(const TransferRequest &request, const BytesCallback &on_bytes, CancelToken &cancel) override;
};

} // namespace uplink
