#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <string>

namespace voice_replacer {
namespace app {

// Written by the signal handler, polled by the main loop
struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGINT or SIGTERM pending
    volatile sig_atomic_t received = 0;  // Last signal number
    volatile sig_atomic_t count = 0;     // Signals since reset()

    void reset() {
        shutdown = 0;
        received = 0;
        count = 0;
    }
};

// A repeated Ctrl+C while the pipeline is still stopping (e.g. a model load
// or synthesis that does not return) ends the process without cleanup
inline bool shouldForceExit(const SignalState& state) {
    return state.count >= 2;
}

const char* signalName(int sig);

/**
 * @brief Runs the shutdown sequence for a pending signal on the main thread.
 *
 * The stop callback halts the pipeline (including the response being
 * spoken); afterwards isRunning() is false.
 */
class ShutdownController {
   public:
    using StopCallback = std::function<void()>;
    using LogCallback = std::function<void(const std::string&)>;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setStopCallback(StopCallback cb) {
        stopCallback_ = std::move(cb);
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // True when a signal was turned into a shutdown
    bool processPendingSignals();

    bool isRunning() const {
        return running_.load();
    }

    int getLastSignal() const {
        return lastSignal_;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<bool> running_{true};
    StopCallback stopCallback_;
    LogCallback logCallback_;
    int lastSignal_ = 0;
};

// Async-signal-safe: sets flags, or _Exit()s on the second signal
void signalHandler(int sig);

SignalState& getGlobalSignalState();

// SIGINT/SIGTERM -> signalHandler
void installSignalHandlers();

}  // namespace app
}  // namespace voice_replacer
