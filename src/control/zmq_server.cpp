#include "voice_replacer/control/zmq_server.h"

#include "voice_replacer/core/error_codes.h"
#include "voice_replacer/logging/logger.h"

#include <cstdio>
#include <zmq.hpp>

namespace voice_replacer {
namespace control {
namespace {

constexpr const char* kShutdownMessage = "SHUTDOWN";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

void trimNull(std::string& value) {
    auto pos = value.find('\0');
    if (pos != std::string::npos) {
        value.erase(pos);
    }
}

}  // namespace

nlohmann::json ZmqRequest::params() const {
    if (json && json->contains("params") && (*json)["params"].is_object()) {
        return (*json)["params"];
    }
    return nlohmann::json::object();
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, std::string pubEndpoint,
                                   int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(pubEndpoint.empty() ? derivePubEndpoint(endpoint_) : std::move(pubEndpoint)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
        repSocket_->set(zmq::sockopt::linger, 0);

        cleanupIpcPath(endpoint_);
        repSocket_->bind(endpoint_);

        pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pubSocket_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(pubEndpoint_);
        pubSocket_->bind(pubEndpoint_);

        running_.store(true);
        bindFailed_.store(false);
        serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

        LOG_INFO("[Control] Listening on {}", endpoint_);
        LOG_INFO("[Control] Publishing events on {}", pubEndpoint_);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("[Control] Cannot bind {}: {}", endpoint_, e.what());
        bindFailed_.store(true);
        running_.store(false);
        cleanupSockets();
        return false;
    }
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake the REP socket so the loop notices running_ without waiting for the timeout
    try {
        zmq::context_t tempCtx{1};
        zmq::socket_t tempSocket{tempCtx, zmq::socket_type::req};
        tempSocket.set(zmq::sockopt::linger, 0);
        tempSocket.connect(endpoint_);
        tempSocket.send(zmq::buffer(std::string(kShutdownMessage)), zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_DEBUG("[Control] Shutdown wake-up failed: {}", e.what());
    }

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        cleanupSockets();
    }
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
    LOG_INFO("[Control] Stopped");
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }

    try {
        pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_EVERY_N(WARN, 100, "[Control] PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::parseRequest(const std::string& raw) {
    ZmqRequest request;
    request.raw = raw;

    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            if (request.json->contains("cmd") && (*request.json)["cmd"].is_string()) {
                request.command = (*request.json)["cmd"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    auto colonPos = raw.find(':');
    if (colonPos != std::string::npos) {
        request.command = raw.substr(0, colonPos);
        request.payload = raw.substr(colonPos + 1);
    } else {
        request.command = raw;
    }
    trimNull(request.command);
    trimNull(request.payload);
    return request;
}

std::string ZmqCommandServer::dispatchRequest(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return errorResponse(request, errorCodeToString(ErrorCode::IPC_PROTOCOL_ERROR),
                             "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string name = request.command.empty() ? "(empty)" : request.command;
        return errorResponse(request, errorCodeToString(ErrorCode::IPC_INVALID_COMMAND),
                             "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("[Control] {} handler failed: {}", request.command, e.what());
        return errorResponse(request, errorCodeToString(ErrorCode::IPC_PROTOCOL_ERROR),
                             std::string("Handler exception: ") + e.what());
    }
}

std::string ZmqCommandServer::okResponse(const ZmqRequest& request, const std::string& message,
                                         const nlohmann::json& data) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!message.empty()) {
            resp["message"] = message;
        }
        if (!data.is_null() && !data.empty()) {
            resp["data"] = data;
        }
        return resp.dump();
    }

    if (!data.is_null() && !data.empty()) {
        return "OK:" + data.dump();
    }
    if (!message.empty()) {
        return "OK:" + message;
    }
    return "OK";
}

std::string ZmqCommandServer::errorResponse(const ZmqRequest& request, const std::string& code,
                                            const std::string& message) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "error";
        resp["error_code"] = code;
        resp["message"] = message;
        return resp.dump();
    }
    return "ERR:" + message;
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t request;
            auto recvResult = repSocket_->recv(request, zmq::recv_flags::none);
            if (!recvResult) {
                continue;
            }

            std::string raw(static_cast<char*>(request.data()), request.size());
            if (raw == kShutdownMessage) {
                repSocket_->send(zmq::buffer(std::string("OK")), zmq::send_flags::dontwait);
                continue;
            }

            LOG_DEBUG("[Control] Request: {}", raw);
            std::string response = dispatchRequest(parseRequest(raw));
            repSocket_->send(zmq::buffer(response), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_ERROR("[Control] Listener error: {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::cleanupSockets() {
    try {
        if (repSocket_) {
            repSocket_->close();
        }
        if (pubSocket_) {
            pubSocket_->close();
        }
    } catch (const zmq::error_t& e) {
        LOG_WARN("[Control] Socket close failed: {}", e.what());
    }
    repSocket_.reset();
    pubSocket_.reset();
    context_.reset();
}

void ZmqCommandServer::cleanupIpcPath(const std::string& endpoint) const {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (path.empty()) {
        return;
    }
    std::remove(path.c_str());
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, "tcp://")) {
        auto colonPos = endpoint.rfind(':');
        if (colonPos != std::string::npos && colonPos > 5) {
            const std::string port = endpoint.substr(colonPos + 1);
            if (!port.empty() && port.find_first_not_of("0123456789") == std::string::npos &&
                port.size() <= 5) {
                return endpoint.substr(0, colonPos + 1) + std::to_string(std::stoi(port) + 1);
            }
        }
    }
    return endpoint + kPubEndpointSuffix;
}

}  // namespace control
}  // namespace voice_replacer
