#pragma once

#include "uplink/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace uplink {

constexpr std::size_t TMP_BUFF_SIZE = 64 * 1024; // 64 KB buffer size
constexpr std::size_t MAX_MSG_SIZE = 16 * 1024 * 1024;

using Deadline = Clock::time_point;

inline Deadline no_deadline() {
    return Deadline::max();
}

struct HostPort {
    std::string host;
    std::uint16_t port{};
};

struct UploadUrl {
    HostPort endpoint;
    std::string object_key;
};

// closes the descriptor on scope exit
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd(fd) {}
    ~ScopedFd();

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;
    ScopedFd(ScopedFd &&other) noexcept;
    ScopedFd &operator=(ScopedFd &&other) noexcept;

    int get() const { return fd; }
    int release();
    void reset(int new_fd = -1);

private:
    int fd;
};

bool parse_host_port(const std::string &input, HostPort &out);
// tcp://host:port/<objectKey>
UploadUrl parse_upload_url(const std::string &url);
std::string make_upload_url(const HostPort &endpoint, const std::string &object_key);

const std::vector<std::string> split(const std::string &str, char sep);

// resolves and connects; dns/connection failures are TransientNetworkErrors
int connect_to(const HostPort &endpoint, Deadline deadline);

// blocks until fd is ready for `events` (POLLIN/POLLOUT) or the deadline passes
void wait_fd(int fd, short events, Deadline deadline);

void send_all(int fd, const char *data, std::size_t length, Deadline deadline);
void recv_exact(int fd, char *data, std::size_t length, Deadline deadline);

size_t receive_length_prefix(int fd, Deadline deadline = no_deadline());
const std::string recv_msg(int fd, Deadline deadline = no_deadline());
void send_msg(int fd, const std::string &msg, Deadline deadline = no_deadline());

} // namespace uplink
