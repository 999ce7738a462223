#pragma once

#include <chrono>
#include <cstdint>
#include <string>

struct ServerOptions {
    std::uint16_t port = 9000;
    std::string root;
    std::string public_host = "127.0.0.1"; // host written into upload urls
    std::chrono::seconds token_ttl{3600};
    std::uint64_t max_object_size = 500ull * 1024 * 1024;
    std::string log_file;
};
