#pragma once

#include "record_store.hpp"
#include "server_context.hpp"
#include "token_registry.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

// a put_object request that passed token and size checks
struct AdmittedPut {
    std::string object_key;
    std::filesystem::path target;
    std::uint64_t size = 0;
    std::string content_hash; // may be empty, then nothing is verified
};

// backend operations, independent of the socket layer
class BackendService {
public:
    explicit BackendService(const ServerOptions &options);

    // handles every op except put_object; failures are returned as {status, error}
    nlohmann::json dispatch(const nlohmann::json &request);

    nlohmann::json createRecords(const nlohmann::json &request);
    nlohmann::json authorizeUploads(const nlohmann::json &request);
    nlohmann::json finalizeRecord(const nlohmann::json &request);

    // throws an UploadError carrying the status to answer with
    AdmittedPut admitPut(const nlohmann::json &header);

    RecordStore &records() { return this->record_store; }
    TokenRegistry &tokens() { return this->token_registry; }
    const ServerOptions &options() const { return this->server_options; }

private:
    ServerOptions server_options;
    RecordStore record_store;
    TokenRegistry token_registry;
};

nlohmann::json error_response(const std::exception &e);
