#pragma once

#include "backend_service.hpp"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

class Flow;

class Session {
public:
    enum class State {
        AwaitingMessage,
        ReceivingObject
    };

    Session(int fd, BackendService &backend);
    ~Session(); // Flow is incomplete here

    // one framed JSON request
    void onMessage(const std::string &msg);
    // raw bytes while a flow is active
    void onReadable();

    // API for flows
    void send(const std::string &msg) const;
    void leaveFlow();

    int getClientFD() const;
    State getState() const;

private:
    void putObject(const nlohmann::json &header);

    const int client_fd;
    BackendService &backend;
    std::unique_ptr<Flow> current_flow;
    bool leave_requested = false;
    State state = State::AwaitingMessage;
};
