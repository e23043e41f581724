#include "voice_replacer/app/graceful_shutdown.h"

#include <cstdlib>

namespace voice_replacer {
namespace app {

namespace {

SignalState g_signalState;

}  // namespace

SignalState& getGlobalSignalState() {
    return g_signalState;
}

const char* signalName(int sig) {
    switch (sig) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return "signal";
    }
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.count = g_signalState.count + 1;
    if (shouldForceExit(g_signalState)) {
        std::_Exit(128 + sig);
    }
    g_signalState.shutdown = 1;
}

void installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool ShutdownController::processPendingSignals() {
    if (!signalState_ || !signalState_->shutdown) {
        return false;
    }

    signalState_->shutdown = 0;
    lastSignal_ = signalState_->received;

    if (logCallback_) {
        logCallback_(std::string("Received ") + signalName(lastSignal_) +
                     ", stopping (repeat to force quit)");
    }
    if (stopCallback_) {
        stopCallback_();
    }
    running_ = false;
    return true;
}

}  // namespace app
}  // namespace voice_replacer
