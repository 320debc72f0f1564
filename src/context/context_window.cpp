#include <novelforge/context/context_window.hpp>
#include <novelforge/context/tokens.hpp>

namespace novelforge {

ContextWindow::ContextWindow(const ContextWindowConfig& config)
    : config_(config)
    , segment_tokens_(0)
{
    if (config_.summary_token_budget < 0) config_.summary_token_budget = 0;
    if (config_.summary_token_budget > config_.token_budget) {
        config_.summary_token_budget = config_.token_budget;
    }
}

std::vector<std::string> ContextWindow::push(const std::string& segment) {
    segments_.push_back(segment);
    segment_costs_.push_back(estimate_tokens(segment));
    segment_tokens_ += segment_costs_.back();

    std::vector<std::string> evicted;
    while (!segments_.empty() &&
           (segments_.size() > config_.max_segments ||
            segment_tokens_ > config_.segment_budget())) {
        evicted.push_back(segments_.front());
        segment_tokens_ -= segment_costs_.front();
        segments_.pop_front();
        segment_costs_.pop_front();
    }
    return evicted;
}

void ContextWindow::set_summary(const std::string& summary) {
    summary_ = truncate_at_sentence(summary, config_.summary_token_budget);
}

std::vector<std::string> ContextWindow::segments() const {
    return std::vector<std::string>(segments_.begin(), segments_.end());
}

int64_t ContextWindow::total_tokens() const {
    return segment_tokens_ + estimate_tokens(summary_);
}

void ContextWindow::restore(const std::vector<std::string>& segments, const std::string& summary) {
    clear();
    set_summary(summary);
    for (size_t i = 0; i < segments.size(); ++i) {
        push(segments[i]);
    }
}

void ContextWindow::clear() {
    segments_.clear();
    segment_costs_.clear();
    segment_tokens_ = 0;
    summary_.clear();
}

} // namespace novelforge
