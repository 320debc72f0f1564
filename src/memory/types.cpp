#include <novelforge/memory/types.hpp>

#include <algorithm>
#include <cmath>

namespace novelforge {

std::string memory_kind_to_string(MemoryKind kind) {
    switch (kind) {
        case MemoryKind::SUMMARY: return "summary";
        case MemoryKind::EVENT: return "event";
        case MemoryKind::CHARACTER_STATE: return "character_state";
        case MemoryKind::PLOT_POINT: return "plot_point";
        case MemoryKind::WORLDBUILDING: return "worldbuilding";
    }
    return "event";
}

bool memory_kind_from_string(const std::string& name, MemoryKind& out) {
    if (name == "summary") { out = MemoryKind::SUMMARY; return true; }
    if (name == "event") { out = MemoryKind::EVENT; return true; }
    if (name == "character_state") { out = MemoryKind::CHARACTER_STATE; return true; }
    if (name == "plot_point") { out = MemoryKind::PLOT_POINT; return true; }
    if (name == "worldbuilding") { out = MemoryKind::WORLDBUILDING; return true; }
    return false;
}

bool MemoryFilter::matches_metadata(const Json& metadata) const {
    if (!metadata_equals.is_object() || metadata_equals.empty()) return true;
    if (!metadata.is_object()) return false;

    for (Json::const_iterator it = metadata_equals.begin(); it != metadata_equals.end(); ++it) {
        Json::const_iterator found = metadata.find(it.key());
        if (found == metadata.end() || *found != it.value()) {
            return false;
        }
    }
    return true;
}

bool MemoryFilter::matches(const MemoryEntry& entry) const {
    if (!kinds.empty() &&
        std::find(kinds.begin(), kinds.end(), entry.kind) == kinds.end()) {
        return false;
    }
    if (created_after > 0 && entry.created_at < created_after) return false;
    if (created_before > 0 && entry.created_at > created_before) return false;
    return matches_metadata(entry.metadata);
}

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) return 0.0;
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

namespace {

bool newer_first(const MemoryHit& a, const MemoryHit& b) {
    if (a.entry.created_at != b.entry.created_at) {
        return a.entry.created_at > b.entry.created_at;
    }
    return a.entry.sequence > b.entry.sequence;
}

bool more_similar(const MemoryHit& a, const MemoryHit& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return newer_first(a, b);
}

} // namespace

void rank_memory_hits(std::vector<MemoryHit>& hits, double epsilon) {
    std::sort(hits.begin(), hits.end(), more_similar);

    // Re-order each run of near-equal scores by recency. A run is anchored
    // at its first (highest) score so runs cannot chain indefinitely.
    size_t start = 0;
    while (start < hits.size()) {
        size_t end = start + 1;
        while (end < hits.size() &&
               hits[start].similarity - hits[end].similarity <= epsilon) {
            ++end;
        }
        if (end - start > 1) {
            std::stable_sort(hits.begin() + start, hits.begin() + end, newer_first);
        }
        start = end;
    }
}

} // namespace novelforge
