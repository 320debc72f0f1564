/*
 * NovelForge C++ - Storage Backend
 *
 * Persistence interface for memory entries, the knowledge graph, graph
 * snapshots, audit records and per-project metadata. The core only talks
 * to this interface; SqliteBackend is the shipped engine.
 *
 * Transactions nest: an inner begin()/commit() pair joins the outer
 * transaction, and an inner rollback() dooms it. Reads issued by the thread
 * that owns the open transaction see its uncommitted writes; other threads
 * read the last committed state.
 */
#ifndef novelforge_STORAGE_BACKEND_HPP
#define novelforge_STORAGE_BACKEND_HPP

#include <novelforge/core/status.hpp>
#include <novelforge/core/json.hpp>
#include <novelforge/memory/types.hpp>
#include <novelforge/graph/types.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

struct AuditRecord {
    int64_t id;
    std::string project_id;
    std::string action;     // "snapshot", "rollback", "conflict", ...
    Json detail;
    int64_t created_at;

    AuditRecord() : id(0), detail(Json::object()), created_at(0) {}
};

struct SnapshotInfo {
    std::string id;
    std::string project_id;
    int64_t graph_version;
    int64_t created_at;

    SnapshotInfo() : graph_version(0), created_at(0) {}
};

class StorageBackend {
public:
    virtual ~StorageBackend() {}

    // ---- Transactions ----
    virtual Status begin() = 0;
    virtual Status commit() = 0;
    virtual Status rollback() = 0;

    // ---- Project metadata ----
    // Dimension is 0 until the first embedding is stored
    virtual Status get_embedding_dimension(const std::string& project_id, int& dimension) = 0;
    virtual Status set_embedding_dimension(const std::string& project_id, int dimension) = 0;
    virtual Status get_graph_version(const std::string& project_id, int64_t& version) = 0;
    virtual Status set_graph_version(const std::string& project_id, int64_t version) = 0;

    // ---- Memory entries ----
    // Assigns entry.sequence
    virtual Status insert_memory(MemoryEntry& entry) = 0;
    virtual Status load_memory(const std::string& id, MemoryEntry& out) = 0;
    // All versions sharing root_id, oldest first
    virtual Status load_chain(const std::string& root_id, std::vector<MemoryEntry>& out) = 0;
    virtual Status delete_memory(const std::string& id) = 0;
    // Latest versions only, ranked by cosine similarity
    virtual Status search_nearest(const std::string& project_id,
                                  const Embedding& query,
                                  const MemoryFilter& filter,
                                  size_t top_k,
                                  double tie_epsilon,
                                  std::vector<MemoryHit>& out) = 0;
    // Latest versions only, newest first
    virtual Status list_recent(const std::string& project_id,
                               const MemoryFilter& filter,
                               size_t limit,
                               std::vector<MemoryEntry>& out) = 0;

    // ---- Knowledge graph ----
    virtual Status load_node(const std::string& project_id, NodeType type,
                             const std::string& key, KnowledgeNode& out) = 0;
    virtual Status load_node_by_id(const std::string& node_id, KnowledgeNode& out) = 0;
    // Insert or overwrite the current row of a node
    virtual Status save_node(const KnowledgeNode& node) = 0;
    virtual Status append_node_history(const KnowledgeNode& node) = 0;
    virtual Status load_node_history(const std::string& node_id,
                                     std::vector<KnowledgeNode>& out) = 0;
    virtual Status insert_edge(const KnowledgeEdge& edge) = 0;
    virtual Status find_edge(const std::string& project_id,
                             const std::string& source_id,
                             const std::string& target_id,
                             const std::string& relation,
                             KnowledgeEdge& out) = 0;
    // Nodes, edges and graph version read as one consistent view
    virtual Status load_graph(const std::string& project_id, GraphSnapshot& out) = 0;
    // Replace the project's nodes and edges; history newer than each
    // restored node's version (or of nodes not restored) is discarded
    virtual Status restore_graph(const std::string& project_id,
                                 const std::vector<KnowledgeNode>& nodes,
                                 const std::vector<KnowledgeEdge>& edges) = 0;

    // ---- Snapshots ----
    virtual Status save_snapshot(const GraphSnapshot& snapshot) = 0;
    virtual Status load_snapshot(const std::string& snapshot_id, GraphSnapshot& out) = 0;
    virtual Status list_snapshots(const std::string& project_id,
                                  std::vector<SnapshotInfo>& out) = 0;

    // ---- Audit ----
    virtual Status append_audit(const AuditRecord& record) = 0;
    virtual Status list_audit(const std::string& project_id,
                              std::vector<AuditRecord>& out) = 0;
};

// Scoped transaction: rolls back on destruction unless commit() succeeded.
class TransactionGuard {
public:
    explicit TransactionGuard(StorageBackend& backend);
    ~TransactionGuard();

    // Outcome of begin()
    const Status& status() const { return begin_status_; }
    bool active() const { return active_; }

    Status commit();
    Status rollback();

private:
    TransactionGuard(const TransactionGuard&);
    TransactionGuard& operator=(const TransactionGuard&);

    StorageBackend& backend_;
    Status begin_status_;
    bool active_;
};

} // namespace novelforge

#endif // novelforge_STORAGE_BACKEND_HPP
