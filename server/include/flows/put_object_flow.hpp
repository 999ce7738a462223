#pragma once

#include "backend_service.hpp"
#include "flows/flow.hpp"

#include "uplink/hasher.hpp"

#include <fstream>

// receives the raw object bytes announced by a put_object header
class PutObjectFlow : public Flow {
public:
    PutObjectFlow(Session *s, AdmittedPut put);
    ~PutObjectFlow() override;

    void onReadable() override;

private:
    void finish();

    AdmittedPut put;
    std::filesystem::path part_path;
    std::ofstream out;
    uplink::Sha256Stream digest;
    std::uint64_t bytes_remaining = 0;
    bool done = false;
};
