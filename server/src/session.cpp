#include "session.hpp"
#include "flows/flow.hpp"
#include "flows/put_object_flow.hpp"

#include "uplink/helpers.hpp"
#include "uplink/log.hpp"

// constructor
Session::Session(int fd, BackendService &backend) : client_fd(fd), backend(backend) {}

// destructor
Session::~Session() = default;

// main message handler
void Session::onMessage(const std::string &msg) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(msg);
    } catch (const nlohmann::json::parse_error &e) {
        this->send(nlohmann::json{{"status", 400}, {"error", "bad_request: Malformed JSON: " + std::string(e.what())}}.dump());
        return;
    }
    if (!request.is_object()) {
        this->send(nlohmann::json{{"status", 400}, {"error", "bad_request: Request must be a JSON object"}}.dump());
        return;
    }

    if (request.value("op", std::string()) == "put_object") {
        this->putObject(request);
        return;
    }
    this->send(this->backend.dispatch(request).dump());
}

void Session::putObject(const nlohmann::json &header) {
    AdmittedPut put;
    try {
        put = this->backend.admitPut(header);
    } catch (const std::exception &e) {
        uplink::log_warning("[put] refused fd=", this->client_fd, ": ", e.what());
        this->send(error_response(e).dump());
        return;
    }

    this->leave_requested = false;
    auto flow = std::make_unique<PutObjectFlow>(this, std::move(put));
    if (this->leave_requested) { // empty object, already stored
        this->leave_requested = false;
        return;
    }
    this->current_flow = std::move(flow);
    this->state = State::ReceivingObject;
}

void Session::onReadable() {
    if (!this->current_flow) {
        return;
    }
    this->current_flow->onReadable();
    if (this->leave_requested) {
        this->current_flow.reset();
        this->leave_requested = false;
        this->state = State::AwaitingMessage;
    }
}

void Session::send(const std::string &msg) const {
    uplink::send_msg(this->client_fd, msg);
}

void Session::leaveFlow() {
    this->leave_requested = true;
}

// getters

int Session::getClientFD() const {
    return this->client_fd;
}

Session::State Session::getState() const {
    return this->state;
}
