#pragma once

#include "voice_replacer/pipeline/pipeline_state.h"

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace voice_replacer {
namespace ui {

/**
 * @brief Presentation capability the pipeline reports to.
 *
 * Called from the pipeline's event dispatcher thread, one call at a time.
 * Implementations marshal onto their own context if they need to.
 */
class Presenter {
   public:
    virtual ~Presenter() = default;

    virtual void renderStatus(const pipeline::PipelineStatus& status) = 0;
    virtual void renderText(const std::string& text) = 0;
    virtual void promptError(const std::string& message) = 0;
};

// Text console: recognized text and state changes as lines on a stream
class ConsolePresenter : public Presenter {
   public:
    explicit ConsolePresenter(std::ostream& out = std::cout, bool showStatus = true);

    void renderStatus(const pipeline::PipelineStatus& status) override;
    void renderText(const std::string& text) override;
    void promptError(const std::string& message) override;

   private:
    std::ostream& out_;
    bool showStatus_;
    std::mutex mutex_;
    pipeline::PipelineState lastState_ = pipeline::PipelineState::Idle;
    double lastLatencyMs_ = 0.0;
};

// Fans every event out to several presenters (console plus ZeroMQ)
class CompositePresenter : public Presenter {
   public:
    void add(std::shared_ptr<Presenter> presenter);
    size_t size() const {
        return presenters_.size();
    }

    void renderStatus(const pipeline::PipelineStatus& status) override;
    void renderText(const std::string& text) override;
    void promptError(const std::string& message) override;

   private:
    std::vector<std::shared_ptr<Presenter>> presenters_;
};

}  // namespace ui
}  // namespace voice_replacer
