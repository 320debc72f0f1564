/*
 * NovelForge C++ - Memory Types
 *
 * Records of the long-term memory archive. An entry is immutable once
 * written; edits append a new version to the entry's chain:
 *
 *   v1 (root_id = v1.id) <- v2 (previous_id = v1.id) <- v3 ...
 *
 * The latest version of a chain is the one no other entry points back to.
 */
#ifndef novelforge_MEMORY_TYPES_HPP
#define novelforge_MEMORY_TYPES_HPP

#include <novelforge/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

enum class MemoryKind {
    SUMMARY,
    EVENT,
    CHARACTER_STATE,
    PLOT_POINT,
    WORLDBUILDING
};

std::string memory_kind_to_string(MemoryKind kind);
bool memory_kind_from_string(const std::string& name, MemoryKind& out);

typedef std::vector<float> Embedding;

struct MemoryEntry {
    std::string id;
    std::string project_id;
    MemoryKind kind;
    std::string content;
    Json metadata;              // Always a JSON object
    Embedding embedding;
    int64_t created_at;         // Unix ms
    std::string previous_id;    // Empty for version 1
    std::string root_id;        // Id of version 1 of the chain
    int version;                // 1-based
    int64_t sequence;           // Insertion order, assigned by storage

    MemoryEntry()
        : kind(MemoryKind::EVENT)
        , metadata(Json::object())
        , created_at(0)
        , version(1)
        , sequence(0) {}
};

struct MemoryFilter {
    std::vector<MemoryKind> kinds;  // Empty = any kind
    int64_t created_after;          // Inclusive lower bound, 0 = unbounded
    int64_t created_before;         // Inclusive upper bound, 0 = unbounded
    Json metadata_equals;           // Object of key -> required value

    MemoryFilter()
        : created_after(0)
        , created_before(0)
        , metadata_equals(Json::object()) {}

    bool matches(const MemoryEntry& entry) const;
    bool matches_metadata(const Json& metadata) const;
};

struct MemoryHit {
    MemoryEntry entry;
    double similarity;

    MemoryHit() : similarity(0.0) {}
};

// Cosine similarity; 0 for empty or mismatched vectors
double cosine_similarity(const Embedding& a, const Embedding& b);

// Order hits by similarity descending. Hits whose similarity lies within
// epsilon of each other are ordered newest first (created_at, then
// sequence).
void rank_memory_hits(std::vector<MemoryHit>& hits, double epsilon);

} // namespace novelforge

#endif // novelforge_MEMORY_TYPES_HPP
