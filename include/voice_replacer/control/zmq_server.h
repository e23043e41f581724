#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace voice_replacer {
namespace control {

constexpr const char* kDefaultControlEndpoint = "ipc:///tmp/voice_replacer.sock";
constexpr const char* kPubEndpointSuffix = ".pub";

// One request on the REP socket: either {"cmd": ..., "params": {...}} JSON or
// plain "CMD" / "CMD:payload" text
struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;
    bool isJson = false;
    std::string parseError;

    // "params" object of a JSON request (empty object otherwise)
    nlohmann::json params() const;
};

/**
 * @brief REP command socket plus a PUB event socket.
 *
 * Handlers run on the server thread, one request at a time. Unknown
 * commands, unparseable JSON and handler exceptions are answered with an
 * IPC error response.
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    // Empty pubEndpoint: derived from endpoint (".pub" suffix for ipc, port+1 for tcp)
    explicit ZmqCommandServer(std::string endpoint = kDefaultControlEndpoint,
                              std::string pubEndpoint = "", int recvTimeoutMs = 1000);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    bool publish(const std::string& message);
    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    static ZmqRequest parseRequest(const std::string& raw);
    static std::string derivePubEndpoint(const std::string& endpoint);

    // Response builders shared with the command handlers
    static std::string okResponse(const ZmqRequest& request, const std::string& message = "",
                                  const nlohmann::json& data = {});
    static std::string errorResponse(const ZmqRequest& request, const std::string& code,
                                     const std::string& message);

   private:
    std::string dispatchRequest(const ZmqRequest& request);
    void serverLoop();
    void cleanupSockets();
    void cleanupIpcPath(const std::string& endpoint) const;

    std::string endpoint_;
    std::string pubEndpoint_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace control
}  // namespace voice_replacer
