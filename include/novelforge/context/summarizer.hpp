/*
 * NovelForge C++ - Recursive Summarizer
 *
 * Folds segments evicted from a ContextWindow into the rolling summary:
 *
 *   summary' = summarize(evicted segment, summary)
 *
 * Each new summary is persisted as a "summary" memory entry with metadata
 * {"rolling_summary": true}. When the provider fails, the evicted text
 * itself is persisted with {"fallback": true} and the summary is left as
 * it was, so no narrative is lost. Entries written while committing a
 * request also carry that request's "seq", so summaries can be selected
 * per chapter range.
 */
#ifndef novelforge_CONTEXT_SUMMARIZER_HPP
#define novelforge_CONTEXT_SUMMARIZER_HPP

#include <novelforge/ai/providers.hpp>
#include <novelforge/memory/store.hpp>
#include <novelforge/core/retry.hpp>
#include <string>
#include <vector>

namespace novelforge {

struct SummarizerConfig {
    int64_t timeout_ms;     // Deadline per provider call (default: 60000)
    RetryPolicy retry;

    SummarizerConfig() : timeout_ms(60000) {}
};

struct FoldResult {
    std::string summary;            // Summary after all folds
    size_t folded;                  // Segments merged into the summary
    size_t fallbacks;               // Segments persisted raw
    std::vector<std::string> entry_ids;

    FoldResult() : folded(0), fallbacks(0) {}
};

class RecursiveSummarizer {
public:
    RecursiveSummarizer(SummarizationProvider& provider,
                        MemoryStore& memory,
                        const SummarizerConfig& config = SummarizerConfig());

    // Fold the evicted segments (oldest first) into previous_summary.
    // A positive seq is recorded in the metadata of every persisted entry.
    // Fails only if persisting an entry fails.
    Status fold(const std::string& project_id,
                const std::vector<std::string>& evicted,
                const std::string& previous_summary,
                FoldResult& out,
                int64_t seq = 0);

    // Newest persisted rolling summary of the project, empty if none
    Status latest_summary(const std::string& project_id, std::string& out);

private:
    SummarizationProvider& provider_;
    MemoryStore& memory_;
    SummarizerConfig config_;

    Status persist(const std::string& project_id, const std::string& content,
                   const Json& metadata, std::string& id);
};

} // namespace novelforge

#endif // novelforge_CONTEXT_SUMMARIZER_HPP
