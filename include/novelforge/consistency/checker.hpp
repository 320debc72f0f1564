/*
 * NovelForge C++ - Consistency Checker
 *
 * Validates the facts extracted from newly generated text against the graph
 * snapshot taken at request start. Facts are evaluated in order; each one
 * sees the snapshot plus everything staged before it in the same batch.
 *
 *   contradiction of an established fact      -> blocking
 *   dead character acting (no flashback)      -> blocking
 *   established rule restated differently     -> blocking
 *   event earlier than a participant's latest -> warning
 *   unknown fact kind                         -> warning
 *   refinement or later state transition      -> info, staged
 *   novel entity or relation                  -> staged
 *
 * Character attributes remember the sequence number they were established
 * at in the bookkeeping attribute "_established": {"attr": seq}.
 */
#ifndef novelforge_CONSISTENCY_CHECKER_HPP
#define novelforge_CONSISTENCY_CHECKER_HPP

#include <novelforge/consistency/facts.hpp>
#include <novelforge/graph/types.hpp>
#include <map>
#include <string>
#include <vector>

namespace novelforge {

enum class Severity {
    INFO,
    WARNING,
    BLOCKING
};

std::string severity_to_string(Severity severity);

enum class FindingKind {
    CONTRADICTION,
    DEAD_CHARACTER_ACTIVE,
    RULE_VIOLATION,
    TIMELINE_REGRESSION,
    REFINEMENT,
    STATE_TRANSITION,
    UNKNOWN_FACT
};

std::string finding_kind_to_string(FindingKind kind);

struct ConsistencyFinding {
    std::string content_ref;                    // Request or entry the fact came from
    FindingKind kind;
    Severity severity;
    std::string description;
    std::vector<std::string> conflicting_refs;  // Node ids or "type:key" refs

    ConsistencyFinding() : kind(FindingKind::REFINEMENT), severity(Severity::INFO) {}

    Json to_json() const;
};

struct CheckResult {
    std::vector<ConsistencyFinding> findings;
    StagedChanges staged;

    bool has_blocking() const;
    size_t count(Severity severity) const;

    // Instruction appended to the next generation attempt
    std::string corrective_instruction() const;

    Json to_json() const;
};

class ConsistencyChecker {
public:
    ConsistencyChecker() {}

    // seq is the request's sequence number, used by facts that carry none.
    // The snapshot must be indexed.
    CheckResult check(const std::string& content_ref,
                      const std::vector<CandidateFact>& facts,
                      const GraphSnapshot& snapshot,
                      int64_t seq) const;
};

} // namespace novelforge

#endif // novelforge_CONSISTENCY_CHECKER_HPP
