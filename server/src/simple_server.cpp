#include "simple_server.hpp"
#include "backend_service.hpp"
#include "session.hpp"

#include "uplink/helpers.hpp"
#include "uplink/log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <memory>
#include <unordered_map>
#include <vector>

namespace {

int create_listen_socket(std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        uplink::log_error("socket: ", std::strerror(errno));
        return -1;
    }

    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        uplink::log_error("setsockopt: ", std::strerror(errno));
        ::close(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        uplink::log_error("bind: ", std::strerror(errno));
        ::close(fd);
        return -1;
    }

    // uploaders open one connection per file and per backend call
    if (::listen(fd, 64) < 0) {
        uplink::log_error("listen: ", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

bool is_disconnect(const std::exception &e) {
    return std::string(e.what()).starts_with("connection_closed");
}

}

bool start_simple_server(const ServerOptions &options) {
    // verify root directory exists
    if (!std::filesystem::is_directory(options.root)) {
        uplink::log_error("Root directory does not exist: ", options.root);
        return false;
    }

    std::unique_ptr<BackendService> backend;
    try {
        backend = std::make_unique<BackendService>(options);
    } catch (const std::exception &e) {
        uplink::log_error("Could not open backend state: ", e.what());
        return false;
    }

    // create listen socket
    int listen_fd = create_listen_socket(options.port);
    if (listen_fd < 0) {
        uplink::log_error("Failed to set up listen socket on port ", options.port);
        return false;
    }
    uplink::log_info("Upload backend listening on port ", options.port, " (", backend->records().size(), " records)");

    std::unordered_map<int, std::unique_ptr<Session>> sessions;

    // main server loop
    std::vector<int> toClose;
    while (true) {
        toClose.clear();

        // add all client fds to set
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listen_fd, &readfds);
        int maxfd = listen_fd;
        for (auto &p : sessions) {
            FD_SET(p.first, &readfds);
            if (p.first > maxfd) maxfd = p.first;
        }

        // wait for event
        int activity = ::select(maxfd + 1, &readfds, nullptr, nullptr, nullptr);
        if (activity < 0) {
            if (errno == EINTR) continue;
            uplink::log_error("select: ", std::strerror(errno));
            break;
        }

        // new client -> accept connection and create session
        if (FD_ISSET(listen_fd, &readfds)) {
            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_fd < 0) {
                uplink::log_error("accept: ", std::strerror(errno));
            } else if (client_fd >= FD_SETSIZE) {
                uplink::log_warning("Too many connections, refusing fd=", client_fd);
                ::close(client_fd);
            } else {
                char ipbuf[INET_ADDRSTRLEN];
                const char* ipstr = ::inet_ntop(AF_INET, &client_addr.sin_addr, ipbuf, sizeof(ipbuf));
                if (ipstr) {
                    uplink::log_debug("Client connected from ", ipstr, ":", ntohs(client_addr.sin_port), " fd=", client_fd);
                }
                sessions.emplace(client_fd, std::make_unique<Session>(client_fd, *backend));
            }
        }

        // handle existing clients
        for (auto &p : sessions) {
            int fd = p.first;
            if (!FD_ISSET(fd, &readfds)) {
                continue;
            }

            // session receives object bytes -> delegate to flow
            if (p.second->getState() == Session::State::ReceivingObject) {
                try {
                    p.second->onReadable();
                } catch (const std::exception &e) {
                    uplink::log_warning("Error receiving object from client ", fd, ": ", e.what());
                    toClose.push_back(fd);
                }
                continue;
            }

            std::string msg;
            try {
                msg = uplink::recv_msg(fd);
            } catch (const std::exception &e) {
                if (!is_disconnect(e)) {
                    uplink::log_warning("Error receiving message from client ", fd, ": ", e.what());
                }
                toClose.push_back(fd);
                continue;
            }

            uplink::log_debug("Received (", msg.size(), " bytes) from fd=", fd);

            // delegate session logic
            try {
                p.second->onMessage(msg);
            } catch (const std::exception &e) {
                uplink::log_warning("Error processing request from client ", fd, ": ", e.what());
                toClose.push_back(fd);
            }
        }

        // close disconnected sessions
        for (int fd : toClose) {
            sessions.erase(fd);
            ::close(fd);
        }
    }

    sessions.clear();
    ::close(listen_fd);
    return false;
}
