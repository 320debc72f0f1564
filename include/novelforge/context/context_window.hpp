/*
 * NovelForge C++ - Sliding Context Window
 *
 * The most recent raw segments of a project plus its rolling summary.
 * The token budget is split in two shares:
 *
 *   summary   <= summary_token_budget
 *   segments  <= token_budget - summary_token_budget, and at most
 *                max_segments of them
 *
 * push() evicts the oldest segments until both limits hold again and hands
 * them back so the caller can fold them into the summary.
 *
 * Not thread-safe; ProjectContext guards it.
 */
#ifndef novelforge_CONTEXT_CONTEXT_WINDOW_HPP
#define novelforge_CONTEXT_CONTEXT_WINDOW_HPP

#include <deque>
#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

struct ContextWindowConfig {
    size_t max_segments;            // Raw segments kept (default: 8)
    int64_t token_budget;           // Whole window, summary included (default: 2000)
    int64_t summary_token_budget;   // Share reserved for the summary (default: 500)

    ContextWindowConfig()
        : max_segments(8)
        , token_budget(2000)
        , summary_token_budget(500) {}

    int64_t segment_budget() const {
        int64_t share = token_budget - summary_token_budget;
        return share > 0 ? share : 0;
    }
};

class ContextWindow {
public:
    explicit ContextWindow(const ContextWindowConfig& config = ContextWindowConfig());

    // Append a segment; returns the evicted segments, oldest first
    std::vector<std::string> push(const std::string& segment);

    // Stored truncated to whole sentences within the summary share
    void set_summary(const std::string& summary);
    const std::string& summary() const { return summary_; }

    // Oldest first
    std::vector<std::string> segments() const;
    size_t size() const { return segments_.size(); }

    int64_t segment_tokens() const { return segment_tokens_; }
    int64_t total_tokens() const;

    // Rebuild from persisted state (segments oldest first). Segments that
    // would not fit are dropped; they were already folded before.
    void restore(const std::vector<std::string>& segments, const std::string& summary);
    void clear();

    const ContextWindowConfig& config() const { return config_; }

private:
    ContextWindowConfig config_;
    std::deque<std::string> segments_;
    std::deque<int64_t> segment_costs_;
    int64_t segment_tokens_;
    std::string summary_;
};

} // namespace novelforge

#endif // novelforge_CONTEXT_CONTEXT_WINDOW_HPP
