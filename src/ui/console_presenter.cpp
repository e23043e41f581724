#include "voice_replacer/ui/presenter.h"

#include <iomanip>

namespace voice_replacer {
namespace ui {

ConsolePresenter::ConsolePresenter(std::ostream& out, bool showStatus)
    : out_(out), showStatus_(showStatus) {}

void ConsolePresenter::renderStatus(const pipeline::PipelineStatus& status) {
    if (!showStatus_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // Only state changes and new latency figures; periodic refreshes stay quiet
    const bool latencyChanged = status.latencyMs > 0.0 && status.latencyMs != lastLatencyMs_;
    if (status.state == lastState_ && !latencyChanged) {
        return;
    }
    lastState_ = status.state;
    out_ << "[" << pipeline::pipelineStateToString(status.state) << "]";
    if (status.isSpeaking) {
        out_ << " speaking";
    }
    if (status.isProcessing) {
        out_ << " processing";
    }
    if (latencyChanged) {
        lastLatencyMs_ = status.latencyMs;
        out_ << " latency " << std::fixed << std::setprecision(0) << status.latencyMs << " ms";
    }
    out_ << std::endl;
}

void ConsolePresenter::renderText(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "Recognized: " << text << std::endl;
}

void ConsolePresenter::promptError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "Error: " << message << std::endl;
}

}  // namespace ui
}  // namespace voice_replacer
