#pragma once

#include "uplink/helpers.hpp"
#include "uplink/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink {

// request/response transport for backend calls
class RpcChannel {
public:
    virtual ~RpcChannel() = default;

    // throws a classified UploadError when the response carries status >= 400
    virtual nlohmann::json call(const std::string &op, const nlohmann::json &params) = 0;
};

// one connection per call, length-prefixed JSON frames
class SocketRpcChannel : public RpcChannel {
public:
    SocketRpcChannel(HostPort endpoint, std::chrono::milliseconds timeout = std::chrono::seconds(30));

    nlohmann::json call(const std::string &op, const nlohmann::json &params) override;

private:
    HostPort endpoint;
    std::chrono::milliseconds timeout;
};

// raises the error carried by a response document, if any
void check_response(const nlohmann::json &response);

// the external record-creation collaborator
class RecordClient {
public:
    virtual ~RecordClient() = default;

    // one pending record per task, ids in input order
    virtual std::vector<std::string> createPending(const std::string &batch_id, const std::vector<FileUploadTask> &files) = 0;
};

struct AuthorizationOutcome {
    std::optional<Authorization> authorization;
    std::string error; // server-supplied reason when authorization is empty
};

using AuthorizationMap = std::map<std::string, AuthorizationOutcome>;

class AuthorizationClient {
public:
    virtual ~AuthorizationClient() = default;

    // one round trip for all ids; partial failures are reported per id
    virtual AuthorizationMap authorize(const std::string &batch_id, const std::vector<std::string> &record_ids, int expiration_hours) = 0;
};

struct FinalizeResult {
    std::uint64_t file_size_bytes = 0;
    double duration_seconds = 0;
    bool already_finalized = false;
};

class FinalizeClient {
public:
    virtual ~FinalizeClient() = default;

    // idempotent on the backend
    virtual FinalizeResult finalize(const std::string &record_id, std::uint64_t file_size_bytes, double duration_seconds) = 0;
};

class RpcRecordClient : public RecordClient {
public:
    explicit RpcRecordClient(RpcChannel &channel) : channel(channel) {}

    std::vector<std::string> createPending(const std::string &batch_id, const std::vector<FileUploadTask> &files) override;

private:
    RpcChannel &channel;
};

class RpcAuthorizationClient : public AuthorizationClient {
public:
    explicit RpcAuthorizationClient(RpcChannel &channel) : channel(channel) {}

    AuthorizationMap authorize(const std::string &batch_id, const std::vector<std::string> &record_ids, int expiration_hours) override;

private:
    RpcChannel &channel;
};

class RpcFinalizeClient : public FinalizeClient {
public:
    explicit RpcFinalizeClient(RpcChannel &channel) : channel(channel) {}

    FinalizeResult finalize(const std::string &record_id, std::uint64_t file_size_bytes, double duration_seconds) override;

private:
    RpcChannel &channel;
};

// wire codecs
void to_json(nlohmann::json &j, const Authorization &auth);
void from_json(const nlohmann::json &j, Authorization &auth);

nlohmann::json make_authorize_request(const std::string &batch_id, const std::vector<std::string> &record_ids, int expiration_hours);
AuthorizationMap parse_authorize_response(const nlohmann::json &response, const std::vector<std::string> &record_ids);

} // namespace uplink
