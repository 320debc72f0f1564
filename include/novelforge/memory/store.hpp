/*
 * NovelForge C++ - Long-Term Memory Store
 *
 * Versioned, embedding-indexed archive of narrative facts.
 *
 * - add() embeds the content (unless prepare() already did) and stores
 *   version 1 of a new chain. The first embedding written to a project
 *   fixes its dimension; a different size later is an EMBEDDING error.
 * - update() appends the next version; every id of a chain resolves to
 *   its latest version.
 * - query() ranks the latest versions by cosine similarity. Scores within
 *   tie_epsilon are ordered newest first.
 * - Metadata "node_refs" (["character:lihang", "<node id>", ...]) must
 *   point at existing graph nodes. Missing ones are rejected or, with
 *   ReferencePolicy::AUTO_CREATE, created as placeholders.
 *
 * Config:
 *   memory.reference_policy  - "reject" (default) or "auto_create"
 *   memory.tie_epsilon       - Similarity tie window (default: 1e-6)
 *   timeouts.embedding_ms    - Deadline per embedding call (default: 30000)
 */
#ifndef novelforge_MEMORY_STORE_HPP
#define novelforge_MEMORY_STORE_HPP

#include <novelforge/memory/types.hpp>
#include <novelforge/memory/query_cache.hpp>
#include <novelforge/storage/backend.hpp>
#include <novelforge/ai/providers.hpp>
#include <novelforge/core/retry.hpp>
#include <string>
#include <vector>

namespace novelforge {

class KnowledgeGraph;

enum class ReferencePolicy {
    REJECT,
    AUTO_CREATE
};

bool reference_policy_from_string(const std::string& name, ReferencePolicy& out);

struct MemoryStoreConfig {
    ReferencePolicy reference_policy;
    double tie_epsilon;
    int64_t embedding_timeout_ms;
    RetryPolicy retry;

    MemoryStoreConfig()
        : reference_policy(ReferencePolicy::REJECT)
        , tie_epsilon(1e-6)
        , embedding_timeout_ms(30000) {}
};

class MemoryStore {
public:
    // graph is needed for AUTO_CREATE; cache is optional
    MemoryStore(StorageBackend& backend,
                EmbeddingProvider& embedder,
                KnowledgeGraph* graph = nullptr,
                QueryCache* cache = nullptr,
                const MemoryStoreConfig& config = MemoryStoreConfig());

    // Compute the embedding now so a later add() makes no provider call
    Status prepare(MemoryEntry& entry, const CancellationToken* cancel = nullptr);

    // Store version 1 of a new chain. Fills id, timestamps and chain fields.
    Status add(MemoryEntry& entry, const CancellationToken* cancel = nullptr);

    Status query(const std::string& project_id,
                 const std::string& text,
                 const MemoryFilter& filter,
                 size_t top_k,
                 std::vector<MemoryHit>& out,
                 const CancellationToken* cancel = nullptr);

    // Append a version with new content; out receives it
    Status update(const std::string& entry_id, const std::string& new_content,
                  MemoryEntry& out, const CancellationToken* cancel = nullptr);

    // Latest version of the chain containing entry_id
    Status get(const std::string& entry_id, MemoryEntry& out);
    Status get_version(const std::string& entry_id, int version, MemoryEntry& out);
    Status history(const std::string& entry_id, std::vector<MemoryEntry>& out);

    // Delete the newest version of a chain; out receives the new latest.
    // A single-version chain cannot be rolled back.
    Status rollback_version(const std::string& entry_id, MemoryEntry& out);

    // Latest versions, newest first
    Status recent(const std::string& project_id, const MemoryFilter& filter,
                  size_t limit, std::vector<MemoryEntry>& out);

    Status embed_text(const std::string& text, Embedding& out,
                      const CancellationToken* cancel = nullptr);

    const MemoryStoreConfig& config() const { return config_; }
    StorageBackend& backend() { return backend_; }

private:
    StorageBackend& backend_;
    EmbeddingProvider& embedder_;
    KnowledgeGraph* graph_;
    QueryCache* cache_;
    MemoryStoreConfig config_;

    Status check_dimension(const std::string& project_id, const Embedding& embedding, bool fix);
    Status check_references(const MemoryEntry& entry);
    Status load_chain_of(const std::string& entry_id, std::vector<MemoryEntry>& chain);
    void invalidate(const std::string& project_id);
};

} // namespace novelforge

#endif // novelforge_MEMORY_STORE_HPP
