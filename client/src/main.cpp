#include "uplink/backend.hpp"
#include "uplink/config.hpp"
#include "uplink/hasher.hpp"
#include "uplink/helpers.hpp"
#include "uplink/log.hpp"
#include "uplink/network_monitor.hpp"
#include "uplink/snapshot_store.hpp"
#include "uplink/transport.hpp"
#include "uplink/upload_coordinator.hpp"
#include "uplink/version.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Options {
    std::string endpoint;
    std::string config_path;
    std::string snapshot_dir;
    std::string log_file;
    std::string resume_id;
    std::vector<std::string> files;
    uplink::DestinationMetadata destination;
    double duration_seconds = 0;
    long cancel_after_ms = -1;
    bool list = false;
    bool verbose = false;
};

void print_help(const char *argv0) {
    std::cout << "Usage: " << argv0 << " <host>:<port> [options] <file>...\n";
    std::cout << "  --config FILE        JSON upload configuration\n";
    std::cout << "  --snapshot-dir DIR   persist batch state so it can be resumed\n";
    std::cout << "  --meta KEY=VALUE     destination field sent with every file\n";
    std::cout << "  --require KEY        field every file must carry (duration_seconds for the duration)\n";
    std::cout << "  --duration SECONDS   media duration of the files\n";
    std::cout << "  --cancel-after MS    cancel the batch after MS milliseconds\n";
    std::cout << "  --resume BATCH_ID    resume an unfinished batch from its snapshot\n";
    std::cout << "  --list               list resumable batches\n";
    std::cout << "  --log FILE           append log lines to FILE\n";
    std::cout << "  --verbose            debug logging\n";
}

std::optional<Options> parse_args(int argc, char *argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--snapshot-dir" && has_value) {
            options.snapshot_dir = argv[++i];
        } else if (arg == "--meta" && has_value) {
            std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::runtime_error("invalid_argument: --meta expects KEY=VALUE, got " + kv);
            }
            options.destination.fields[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg == "--require" && has_value) {
            options.destination.required_fields.push_back(argv[++i]);
        } else if (arg == "--duration" && has_value) {
            options.duration_seconds = std::stod(argv[++i]);
        } else if (arg == "--cancel-after" && has_value) {
            options.cancel_after_ms = std::stol(argv[++i]);
        } else if (arg == "--resume" && has_value) {
            options.resume_id = argv[++i];
        } else if (arg == "--log" && has_value) {
            options.log_file = argv[++i];
        } else if (arg == "--list") {
            options.list = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("invalid_argument: Unknown option " + arg);
        } else if (options.endpoint.empty()) {
            options.endpoint = arg;
        } else {
            options.files.push_back(arg);
        }
    }
    return options;
}

// prints status transitions and coarse byte progress while a batch runs
void print_event(const uplink::ProgressEvent &event, std::vector<int> &last_percent) {
    if (const auto *file = std::get_if<uplink::UploadFileProgress>(&event)) {
        if (file->index >= last_percent.size()) {
            last_percent.resize(file->index + 1, -1);
        }
        if (file->byte_update) {
            int percent = file->file_size_bytes == 0 ? 100 : static_cast<int>(file->uploaded_bytes * 100 / file->file_size_bytes);
            // quarter steps keep the output readable
            if (percent / 25 > last_percent[file->index] / 25) {
                last_percent[file->index] = percent;
                std::cout << "  " << file->file_name << " " << percent << "% (" << static_cast<long>(file->upload_speed_bps / 1024)
                          << " KiB/s, eta " << static_cast<long>(file->eta_seconds) << "s)" << std::endl;
            }
            return;
        }
        std::cout << "[" << uplink::to_string(file->status) << "] " << file->file_name;
        if (file->retry_count > 0) {
            std::cout << " (retry " << file->retry_count << ")";
        }
        if (file->is_stalled) {
            std::cout << " stalled";
        }
        if (!file->error.empty()) {
            std::cout << ": " << file->error;
        }
        std::cout << std::endl;
    }
}

}

int main(int argc, char* argv[]) {
    std::optional<Options> parsed;
    try {
        parsed = parse_args(argc, argv);
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        print_help(argv[0]);
        return 1;
    }
    if (!parsed || parsed->endpoint.empty()) {
        print_help(argv[0]);
        return parsed ? 1 : 0;
    }
    Options options = std::move(*parsed);

    uplink::HostPort hp;
    if (!uplink::parse_host_port(options.endpoint, hp)) {
        std::cerr << "Invalid endpoint format: " << options.endpoint << std::endl;
        return 1;
    }

    try {
        uplink::set_log_level(options.verbose ? uplink::LogLevel::Debug : uplink::LogLevel::Warning);
        if (!options.log_file.empty()) {
            uplink::set_log_file(options.log_file);
        }
        uplink::ensure_sodium();

        uplink::UploadConfig config = options.config_path.empty() ? uplink::UploadConfig{} : uplink::load_config(options.config_path);

        std::cout << "Uplink client (version " << uplink::version() << ")" << std::endl;

        uplink::SocketRpcChannel channel(hp);
        uplink::RpcRecordClient records(channel);
        uplink::RpcAuthorizationClient authorizer(channel);
        uplink::RpcFinalizeClient finalizer(channel);
        uplink::NetworkMonitor monitor(config.slow_threshold_bps);
        monitor.pollSystem();
        uplink::Sha256Hasher hasher;
        uplink::SocketTransport transport;
        std::unique_ptr<uplink::FileSnapshotStore> snapshots;
        if (!options.snapshot_dir.empty()) {
            snapshots = std::make_unique<uplink::FileSnapshotStore>(options.snapshot_dir,
                                                                    std::chrono::hours(config.snapshot_freshness_hours));
        }

        uplink::UploadCoordinator coordinator(config, records, authorizer, finalizer, monitor, transport, hasher, snapshots.get());

        if (options.list) {
            auto ids = coordinator.recoverable();
            if (ids.empty()) {
                std::cout << "No unfinished batches found." << std::endl;
            }
            for (const auto &id : ids) {
                std::cout << id << std::endl;
            }
            return 0;
        }

        uplink::BatchHandle handle;
        if (!options.resume_id.empty()) {
            handle = coordinator.resume(options.resume_id);
        } else {
            std::vector<uplink::UploadFile> files;
            for (const auto &path : options.files) {
                uplink::UploadFile file;
                file.path = path;
                file.duration_seconds = options.duration_seconds;
                files.push_back(std::move(file));
            }
            handle = coordinator.submit(files, options.destination);
        }
        std::cout << "Batch " << handle.batch_id << std::endl;

        auto subscription = coordinator.subscribe();
        uplink::CancelToken done;

        // drains progress and feeds the monitor with the OS link state
        std::thread printer([&] {
            std::vector<int> last_percent;
            auto next_poll = uplink::Clock::now();
            while (!done.cancelled()) {
                if (uplink::Clock::now() >= next_poll) {
                    monitor.pollSystem();
                    next_poll = uplink::Clock::now() + std::chrono::seconds(2);
                }
                if (auto event = subscription->next(std::chrono::milliseconds(250))) {
                    print_event(*event, last_percent);
                }
            }
            while (auto event = subscription->tryNext()) {
                print_event(*event, last_percent);
            }
        });

        std::thread canceller;
        if (options.cancel_after_ms >= 0) {
            canceller = std::thread([&] {
                if (done.waitFor(std::chrono::milliseconds(options.cancel_after_ms))) {
                    std::cout << "Cancelling batch " << handle.batch_id << std::endl;
                    coordinator.cancel(handle.batch_id);
                }
            });
        }

        uplink::UploadBatch batch;
        try {
            batch = coordinator.run(handle);
        } catch (const std::exception &e) {
            done.cancel();
            printer.join();
            if (canceller.joinable()) canceller.join();
            throw;
        }
        done.cancel();
        printer.join();
        if (canceller.joinable()) canceller.join();
        subscription->close();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(batch.end_time - batch.start_time);
        std::cout << "Completed " << batch.completed_files << "/" << batch.total_files << ", failed " << batch.failed_files
                  << " in " << elapsed.count() << "ms" << std::endl;
        if (subscription->dropped() > 0) {
            uplink::log_debug("progress events dropped: ", subscription->dropped());
        }

        if (batch.completed_files == batch.total_files) {
            coordinator.close(batch.batch_id);
            return 0;
        }
        if (snapshots) {
            std::cout << "Resume with: --resume " << batch.batch_id << std::endl;
        }
        return 3;
    } catch (const uplink::ValidationError &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 2;
    }
}
