#include <cstdint>
#include <iostream>
#include <string>

#include "uplink/log.hpp"
#include "uplink/version.hpp"
#include "simple_server.hpp"

namespace {

void usage() {
    std::cerr << "Usage: uplink-server --root <dir> [--port N] [--public-host HOST] [--token-ttl SECONDS]\n"
                 "                     [--max-object-size BYTES] [--log FILE] [--verbose]" << std::endl;
}

}

int main(int argc, char* argv[]) {
    ServerOptions options;
    bool verbose = false;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--port" && has_value) {
                options.port = static_cast<std::uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--root" && has_value) {
                options.root = argv[++i];
            } else if (arg == "--public-host" && has_value) {
                options.public_host = argv[++i];
            } else if (arg == "--token-ttl" && has_value) {
                options.token_ttl = std::chrono::seconds(std::stol(argv[++i]));
            } else if (arg == "--max-object-size" && has_value) {
                options.max_object_size = std::stoull(argv[++i]);
            } else if (arg == "--log" && has_value) {
                options.log_file = argv[++i];
            } else if (arg == "--verbose") {
                verbose = true;
            } else {
                usage();
                return 1;
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: invalid argument value (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (options.root.empty()) {
        std::cerr << "Error: --root <path> argument is required" << std::endl;
        usage();
        return 1;
    }

    try {
        uplink::set_log_level(verbose ? uplink::LogLevel::Debug : uplink::LogLevel::Info);
        if (!options.log_file.empty()) {
            uplink::set_log_file(options.log_file);
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    uplink::log_info("Starting upload backend (version ", uplink::version(), ") on port ", options.port);
    bool ok = start_simple_server(options);
    uplink::log_info("Server exited.");
    return ok ? 0 : 1;
}
