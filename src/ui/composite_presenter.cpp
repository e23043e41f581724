#include "voice_replacer/ui/presenter.h"

#include <utility>

namespace voice_replacer {
namespace ui {

void CompositePresenter::add(std::shared_ptr<Presenter> presenter) {
    if (presenter) {
        presenters_.push_back(std::move(presenter));
    }
}

void CompositePresenter::renderStatus(const pipeline::PipelineStatus& status) {
    for (auto& presenter : presenters_) {
        presenter->renderStatus(status);
    }
}

void CompositePresenter::renderText(const std::string& text) {
    for (auto& presenter : presenters_) {
        presenter->renderText(text);
    }
}

void CompositePresenter::promptError(const std::string& message) {
    for (auto& presenter : presenters_) {
        presenter->promptError(message);
    }
}

}  // namespace ui
}  // namespace voice_replacer
