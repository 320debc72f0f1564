/*
 * NovelForge C++ - Memory Store Implementation
 */
#include <novelforge/memory/store.hpp>
#include <novelforge/graph/knowledge_graph.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

bool reference_policy_from_string(const std::string& name, ReferencePolicy& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "reject") { out = ReferencePolicy::REJECT; return true; }
    if (lower == "auto_create") { out = ReferencePolicy::AUTO_CREATE; return true; }
    return false;
}

MemoryStore::MemoryStore(StorageBackend& backend,
                         EmbeddingProvider& embedder,
                         KnowledgeGraph* graph,
                         QueryCache* cache,
                         const MemoryStoreConfig& config)
    : backend_(backend)
    , embedder_(embedder)
    , graph_(graph)
    , cache_(cache)
    , config_(config)
{}

void MemoryStore::invalidate(const std::string& project_id) {
    if (cache_) cache_->invalidate(project_id);
}

// ============================================================================
// Embedding
// ============================================================================

Status MemoryStore::embed_text(const std::string& text, Embedding& out,
                               const CancellationToken* cancel)
{
    Embedding vector;
    Status s = retry_transient(config_.retry, cancel, "embedding", [&]() {
        return call_with_timeout([&](const CancellationToken& token) {
            EmbeddingResult result = embedder_.embed(text, token);
            if (result.ok()) vector = result.vector;
            return result.status;
        }, config_.embedding_timeout_ms, cancel, "embedding", ErrorCode::EMBEDDING);
    });

    if (!s.ok()) {
        if (s.code == ErrorCode::CANCELLED || s.code == ErrorCode::EMBEDDING) return s;
        return Status::fail(ErrorCode::EMBEDDING,
                            embedder_.provider_id() + " embedding failed: " + s.error);
    }
    if (vector.empty()) {
        return Status::fail(ErrorCode::EMBEDDING, embedder_.provider_id() + " returned an empty vector");
    }
    out.swap(vector);
    return Status::ok_status();
}

Status MemoryStore::check_dimension(const std::string& project_id, const Embedding& embedding,
                                    bool fix)
{
    int dimension = 0;
    Status s = backend_.get_embedding_dimension(project_id, dimension);
    if (!s.ok()) return s;

    if (dimension == 0) {
        if (!fix) return Status::ok_status();
        LOG_INFO("[MemoryStore] Project %s embedding dimension fixed at %zu",
                 project_id.c_str(), embedding.size());
        return backend_.set_embedding_dimension(project_id, static_cast<int>(embedding.size()));
    }
    if (static_cast<size_t>(dimension) != embedding.size()) {
        return Status::fail(ErrorCode::EMBEDDING,
                            "embedding dimension " + std::to_string(embedding.size()) +
                            " does not match project dimension " + std::to_string(dimension));
    }
    return Status::ok_status();
}

// ============================================================================
// Cross-references
// ============================================================================

Status MemoryStore::check_references(const MemoryEntry& entry) {
    Json::const_iterator refs = entry.metadata.find("node_refs");
    if (refs == entry.metadata.end()) return Status::ok_status();
    if (!refs->is_array()) {
        return Status::fail(ErrorCode::VALIDATION, "metadata node_refs must be an array");
    }

    for (size_t i = 0; i < refs->size(); ++i) {
        const Json& item = (*refs)[i];
        if (!item.is_string()) {
            return Status::fail(ErrorCode::VALIDATION, "metadata node_refs entries must be strings");
        }
        std::string ref = item.get<std::string>();

        NodeType type;
        std::string key;
        KnowledgeNode node;
        if (parse_node_ref(ref, type, key)) {
            Status s = backend_.load_node(entry.project_id, type, key, node);
            if (s.ok()) continue;
            if (s.code != ErrorCode::NOT_FOUND) return s;

            if (config_.reference_policy == ReferencePolicy::AUTO_CREATE && graph_) {
                Json attrs = Json::object();
                attrs["placeholder"] = true;
                s = graph_->upsert_node(entry.project_id, type, key, attrs, node);
                if (!s.ok()) return s;
                LOG_INFO("[MemoryStore] Created placeholder node %s", ref.c_str());
                continue;
            }
            return Status::fail(ErrorCode::REFERENCE, "dangling node reference: " + ref);
        }

        Status s = backend_.load_node_by_id(ref, node);
        if (s.ok() && node.project_id == entry.project_id) continue;
        if (!s.ok() && s.code != ErrorCode::NOT_FOUND) return s;
        return Status::fail(ErrorCode::REFERENCE, "dangling node reference: " + ref);
    }
    return Status::ok_status();
}

// ============================================================================
// Writes
// ============================================================================

Status MemoryStore::prepare(MemoryEntry& entry, const CancellationToken* cancel) {
    if (!entry.embedding.empty()) return Status::ok_status();
    if (trim(entry.content).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "memory content is empty");
    }
    return embed_text(entry.content, entry.embedding, cancel);
}

Status MemoryStore::add(MemoryEntry& entry, const CancellationToken* cancel) {
    if (entry.project_id.empty()) {
        return Status::fail(ErrorCode::VALIDATION, "memory entry needs a project id");
    }
    if (trim(entry.content).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "memory content is empty");
    }
    if (entry.metadata.is_null()) entry.metadata = Json::object();
    if (!entry.metadata.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "memory metadata must be a JSON object");
    }

    Status s = prepare(entry, cancel);
    if (!s.ok()) return s;

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    s = check_dimension(entry.project_id, entry.embedding, true);
    if (!s.ok()) return s;
    s = check_references(entry);
    if (!s.ok()) return s;

    if (entry.id.empty()) entry.id = generate_uuid();
    if (entry.created_at == 0) entry.created_at = current_timestamp_ms();
    entry.previous_id.clear();
    entry.root_id = entry.id;
    entry.version = 1;

    s = backend_.insert_memory(entry);
    if (!s.ok()) return s;

    s = tx.commit();
    if (!s.ok()) return s;

    invalidate(entry.project_id);
    LOG_DEBUG("[MemoryStore] Added %s entry %s to project %s",
              memory_kind_to_string(entry.kind).c_str(), entry.id.c_str(),
              entry.project_id.c_str());
    return Status::ok_status();
}

Status MemoryStore::load_chain_of(const std::string& entry_id, std::vector<MemoryEntry>& chain) {
    MemoryEntry entry;
    Status s = backend_.load_memory(entry_id, entry);
    if (!s.ok()) return s;

    s = backend_.load_chain(entry.root_id, chain);
    if (!s.ok()) return s;
    if (chain.empty()) {
        return Status::fail(ErrorCode::NOT_FOUND, "memory chain missing for " + entry_id);
    }
    return Status::ok_status();
}

Status MemoryStore::update(const std::string& entry_id, const std::string& new_content,
                           MemoryEntry& out, const CancellationToken* cancel)
{
    if (trim(new_content).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "memory content is empty");
    }

    Embedding embedding;
    Status s = embed_text(new_content, embedding, cancel);
    if (!s.ok()) return s;

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    std::vector<MemoryEntry> chain;
    s = load_chain_of(entry_id, chain);
    if (!s.ok()) return s;
    const MemoryEntry& latest = chain.back();

    MemoryEntry next;
    next.id = generate_uuid();
    next.project_id = latest.project_id;
    next.kind = latest.kind;
    next.content = new_content;
    next.metadata = latest.metadata;
    next.embedding.swap(embedding);
    next.created_at = current_timestamp_ms();
    if (next.created_at < latest.created_at) next.created_at = latest.created_at;
    next.previous_id = latest.id;
    next.root_id = latest.root_id;
    next.version = latest.version + 1;

    s = check_dimension(next.project_id, next.embedding, true);
    if (!s.ok()) return s;
    s = check_references(next);
    if (!s.ok()) return s;

    s = backend_.insert_memory(next);
    if (!s.ok()) return s;

    s = tx.commit();
    if (!s.ok()) return s;

    invalidate(next.project_id);
    LOG_DEBUG("[MemoryStore] Entry %s now at version %d", next.root_id.c_str(), next.version);
    out = next;
    return Status::ok_status();
}

Status MemoryStore::rollback_version(const std::string& entry_id, MemoryEntry& out) {
    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    std::vector<MemoryEntry> chain;
    Status s = load_chain_of(entry_id, chain);
    if (!s.ok()) return s;
    if (chain.size() < 2) {
        return Status::fail(ErrorCode::VALIDATION,
                            "entry " + entry_id + " has a single version; nothing to roll back");
    }

    const MemoryEntry& newest = chain.back();
    s = backend_.delete_memory(newest.id);
    if (!s.ok()) return s;

    s = tx.commit();
    if (!s.ok()) return s;

    invalidate(newest.project_id);
    LOG_INFO("[MemoryStore] Rolled back entry %s from version %d to %d",
             newest.root_id.c_str(), newest.version, chain[chain.size() - 2].version);
    out = chain[chain.size() - 2];
    return Status::ok_status();
}

// ============================================================================
// Reads
// ============================================================================

Status MemoryStore::query(const std::string& project_id,
                          const std::string& text,
                          const MemoryFilter& filter,
                          size_t top_k,
                          std::vector<MemoryHit>& out,
                          const CancellationToken* cancel)
{
    if (top_k == 0) {
        return Status::fail(ErrorCode::VALIDATION, "topK must be at least 1");
    }
    if (trim(text).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "query text is empty");
    }

    std::string key;
    uint64_t generation = 0;
    if (cache_) {
        key = QueryCache::make_key(text, filter, top_k);
        generation = cache_->generation(project_id);
        if (cache_->get(project_id, key, out)) {
            LOG_DEBUG("[MemoryStore] Cache hit for project %s", project_id.c_str());
            return Status::ok_status();
        }
    }

    Embedding embedding;
    Status s = embed_text(text, embedding, cancel);
    if (!s.ok()) return s;

    s = retry_transient(config_.retry, cancel, "memory search", [&]() {
        out.clear();
        Status d = check_dimension(project_id, embedding, false);
        if (!d.ok()) return d;
        return backend_.search_nearest(project_id, embedding, filter, top_k,
                                       config_.tie_epsilon, out);
    });
    if (!s.ok()) return s;

    if (cache_) cache_->put(project_id, key, out, generation);
    return Status::ok_status();
}

Status MemoryStore::get(const std::string& entry_id, MemoryEntry& out) {
    std::vector<MemoryEntry> chain;
    Status s = load_chain_of(entry_id, chain);
    if (!s.ok()) return s;
    out = chain.back();
    return Status::ok_status();
}

Status MemoryStore::get_version(const std::string& entry_id, int version, MemoryEntry& out) {
    std::vector<MemoryEntry> chain;
    Status s = load_chain_of(entry_id, chain);
    if (!s.ok()) return s;

    for (size_t i = 0; i < chain.size(); ++i) {
        if (chain[i].version == version) {
            out = chain[i];
            return Status::ok_status();
        }
    }
    return Status::fail(ErrorCode::NOT_FOUND,
                        "entry " + entry_id + " has no version " + std::to_string(version));
}

Status MemoryStore::history(const std::string& entry_id, std::vector<MemoryEntry>& out) {
    return load_chain_of(entry_id, out);
}

Status MemoryStore::recent(const std::string& project_id, const MemoryFilter& filter,
                           size_t limit, std::vector<MemoryEntry>& out)
{
    out.clear();
    if (limit == 0) return Status::ok_status();
    return backend_.list_recent(project_id, filter, limit, out);
}

} // namespace novelforge
