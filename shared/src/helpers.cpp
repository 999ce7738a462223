#include "uplink/helpers.hpp"
#include "uplink/errors.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace uplink {

namespace {

class AddrInfo {
public:
    AddrInfo(const std::string &host, const std::string &port) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &info);
        if (rc != 0) {
            throw TransientNetworkError("dns: Failed to resolve " + host + ": " + ::gai_strerror(rc));
        }
    }

    ~AddrInfo() {
        if (info != nullptr) {
            ::freeaddrinfo(info);
        }
    }

    struct addrinfo *get() const { return info; }

private:
    struct addrinfo *info = nullptr;
};

int remaining_ms(Deadline deadline) {
    if (deadline == no_deadline()) {
        return -1;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(left, 1000LL * 60 * 60));
}

TransientNetworkError socket_error(const std::string &what) {
    int err = errno;
    if (err == ECONNRESET || err == EPIPE) {
        return TransientNetworkError("connection: Connection reset during " + what);
    }
    return TransientNetworkError("connection: " + what + " failed: " + std::strerror(err));
}

} // namespace

ScopedFd::~ScopedFd() {
    this->reset();
}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : fd(other.release()) {
}

ScopedFd &ScopedFd::operator=(ScopedFd &&other) noexcept {
    if (this != &other) {
        this->reset(other.release());
    }
    return *this;
}

int ScopedFd::release() {
    int old = this->fd;
    this->fd = -1;
    return old;
}

void ScopedFd::reset(int new_fd) {
    if (this->fd >= 0) {
        ::close(this->fd);
    }
    this->fd = new_fd;
}

bool parse_host_port(const std::string &input, HostPort &out) {
    auto colon = input.rfind(':');
    if (colon == std::string::npos) return false;
    std::string host = input.substr(0, colon);
    std::string port_str = input.substr(colon + 1);
    if (host.empty() || port_str.empty()) return false;
    char *end = nullptr;
    long p = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || p <= 0 || p > 65535) return false;
    out.host = std::move(host);
    out.port = static_cast<std::uint16_t>(p);
    return true;
}

UploadUrl parse_upload_url(const std::string &url) {
    const std::string scheme = "tcp://";
    if (!url.starts_with(scheme)) {
        throw NonRetryableClientError("malformed_url: Unsupported upload URL: " + url);
    }
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    if (slash == std::string::npos || slash + 1 >= rest.size()) {
        throw NonRetryableClientError("malformed_url: Upload URL has no object key: " + url);
    }
    UploadUrl parsed;
    if (!parse_host_port(rest.substr(0, slash), parsed.endpoint)) {
        throw NonRetryableClientError("malformed_url: Invalid endpoint in upload URL: " + url);
    }
    parsed.object_key = rest.substr(slash + 1);
    return parsed;
}

std::string make_upload_url(const HostPort &endpoint, const std::string &object_key) {
    return "tcp://" + endpoint.host + ":" + std::to_string(endpoint.port) + "/" + object_key;
}

const std::vector<std::string> split(const std::string &str, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= str.size()) {
        size_t pos = str.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

int connect_to(const HostPort &endpoint, Deadline deadline) {
    AddrInfo info(endpoint.host, std::to_string(endpoint.port));
    std::string last_error = "no usable address";
    for (struct addrinfo *ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        ScopedFd sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        // non-blocking connect so the deadline applies
        int flags = ::fcntl(sock.get(), F_GETFL, 0);
        ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            continue;
        }
        if (rc < 0) {
            wait_fd(sock.get(), POLLOUT, deadline);
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            ::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last_error = std::strerror(so_error);
                continue;
            }
        }
        ::fcntl(sock.get(), F_SETFL, flags);
        return sock.release();
    }
    throw TransientNetworkError("connection: Failed to connect to " + endpoint.host + ":" + std::to_string(endpoint.port) + ": " + last_error);
}

void wait_fd(int fd, short events, Deadline deadline) {
    while (true) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw socket_error("poll");
        }
        if (rc == 0) {
            throw TransientNetworkError("timeout: Socket operation timed out");
        }
        return;
    }
}

void send_all(int fd, const char *data, std::size_t length, Deadline deadline) {
    std::size_t sent = 0;
    while (sent < length) {
        wait_fd(fd, POLLOUT, deadline);
        ssize_t rc = ::send(fd, data + sent, length - sent, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw socket_error("send");
        }
        sent += static_cast<std::size_t>(rc);
    }
}

void recv_exact(int fd, char *data, std::size_t length, Deadline deadline) {
    std::size_t received = 0;
    while (received < length) {
        wait_fd(fd, POLLIN, deadline);
        ssize_t rc = ::recv(fd, data + received, length - received, 0);
        if (rc < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw socket_error("recv");
        }
        if (rc == 0) {
            throw TransientNetworkError("connection_closed: Connection closed by remote node");
        }
        received += static_cast<std::size_t>(rc);
    }
}

size_t receive_length_prefix(int fd, Deadline deadline) {
    char c = '\0';
    size_t length = 0;
    size_t digits = 0;
    while (true) {
        recv_exact(fd, &c, 1, deadline);
        if (c == ' ') {
            break;
        }
        if (c < '0' || c > '9' || ++digits > 12) {
            throw NonRetryableClientError("bad_frame: Invalid length prefix");
        }
        length *= 10;
        length += static_cast<size_t>(c - '0');
    }
    if (length > MAX_MSG_SIZE) {
        throw NonRetryableClientError("bad_frame: Message too large (" + std::to_string(length) + " bytes)");
    }
    return length;
}

const std::string recv_msg(int fd, Deadline deadline) {
    // receive message length
    size_t len = receive_length_prefix(fd, deadline);

    // receive full message
    std::string result(len, '\0');
    if (len > 0) {
        recv_exact(fd, result.data(), len, deadline);
    }
    return result;
}

void send_msg(int fd, const std::string &msg, Deadline deadline) {
    // add length prefix
    std::string full_msg = std::to_string(msg.size()) + ' ' + msg;
    send_all(fd, full_msg.data(), full_msg.size(), deadline);
}

} // namespace uplink
