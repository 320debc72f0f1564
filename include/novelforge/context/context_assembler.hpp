/*
 * NovelForge C++ - Context Assembler
 *
 * Builds the bounded prompt context for a generation request.
 *
 * When everything does not fit the token budget, parts are admitted in
 * priority order until the budget runs out:
 *
 *   1. pinned facts
 *   2. retrieved memories (rank order)
 *   3. outline paragraphs
 *   4. recent window segments, newest first
 *   5. rolling summary
 *
 * A part is either included whole or dropped, and a section header is
 * charged against the budget together with the first part of its section.
 * The rendered layout is:
 *
 *   [PINNED FACTS]     - one line per fact
 *   [RELEVANT MEMORY]  - one line per retrieved entry
 *   [OUTLINE]
 *   [STORY SO FAR]     - rolling summary
 *   [RECENT]           - kept segments, oldest first
 */
#ifndef novelforge_CONTEXT_CONTEXT_ASSEMBLER_HPP
#define novelforge_CONTEXT_CONTEXT_ASSEMBLER_HPP

#include <novelforge/memory/store.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

struct AssembledContext {
    std::string text;
    int64_t token_count;
    int64_t token_budget;

    size_t pinned_kept;
    size_t retrieved_kept;
    size_t outline_kept;
    size_t recent_kept;
    bool summary_kept;
    size_t dropped;                         // Parts that did not fit

    std::vector<std::string> memory_ids;    // Retrieved entries included

    AssembledContext()
        : token_count(0)
        , token_budget(0)
        , pinned_kept(0)
        , retrieved_kept(0)
        , outline_kept(0)
        , recent_kept(0)
        , summary_kept(false)
        , dropped(0) {}

    Json to_json() const;
};

class ContextAssembler {
public:
    explicit ContextAssembler(MemoryStore& memory);

    // Similarity-ranked memories for the query (newest wins near-ties)
    Status retrieve_relevant(const std::string& query,
                             const std::string& project_id,
                             size_t top_k,
                             const MemoryFilter& filter,
                             std::vector<MemoryHit>& out,
                             const CancellationToken* cancel = nullptr);

    // recent_segments are oldest first, retrieved in rank order
    AssembledContext build_context(const std::vector<std::string>& recent_segments,
                                   const std::vector<MemoryHit>& retrieved,
                                   const std::string& outline,
                                   int64_t token_budget,
                                   const std::vector<std::string>& pinned = std::vector<std::string>(),
                                   const std::string& rolling_summary = std::string()) const;

    // Blank-line or line separated paragraphs, trimmed, empty ones skipped
    static std::vector<std::string> split_outline(const std::string& outline);

private:
    MemoryStore& memory_;
};

} // namespace novelforge

#endif // novelforge_CONTEXT_CONTEXT_ASSEMBLER_HPP
