/*
 * NovelForge C++ - SQLite Storage Backend
 *
 * WAL-mode database with two connections:
 *   writer - all writes and the open transaction (serialized by a mutex
 *            held from begin() to commit()/rollback())
 *   reader - read-only connection used by every thread that does not own
 *            the open transaction, so readers never wait on a commit
 *
 * Embeddings are stored as little-endian float32 BLOBs; similarity search
 * is a linear cosine scan over the project's latest entry versions.
 *
 * Error mapping: SQLITE_BUSY/SQLITE_LOCKED are transient STORAGE failures,
 * SQLITE_CORRUPT/SQLITE_NOTADB are CORRUPTION, everything else STORAGE.
 */
#ifndef novelforge_STORAGE_SQLITE_BACKEND_HPP
#define novelforge_STORAGE_SQLITE_BACKEND_HPP

#include <novelforge/storage/backend.hpp>
#include <atomic>
#include <mutex>
#include <thread>

struct sqlite3;

namespace novelforge {

class SqliteBackend : public StorageBackend {
public:
    SqliteBackend();
    ~SqliteBackend();

    // Path ":memory:" keeps everything in one private connection
    Status open(const std::string& db_path);
    void close();
    bool is_open() const { return write_db_ != nullptr; }
    const std::string& path() const { return path_; }

    Status begin();
    Status commit();
    Status rollback();

    Status get_embedding_dimension(const std::string& project_id, int& dimension);
    Status set_embedding_dimension(const std::string& project_id, int dimension);
    Status get_graph_version(const std::string& project_id, int64_t& version);
    Status set_graph_version(const std::string& project_id, int64_t version);

    Status insert_memory(MemoryEntry& entry);
    Status load_memory(const std::string& id, MemoryEntry& out);
    Status load_chain(const std::string& root_id, std::vector<MemoryEntry>& out);
    Status delete_memory(const std::string& id);
    Status search_nearest(const std::string& project_id,
                          const Embedding& query,
                          const MemoryFilter& filter,
                          size_t top_k,
                          double tie_epsilon,
                          std::vector<MemoryHit>& out);
    Status list_recent(const std::string& project_id,
                       const MemoryFilter& filter,
                       size_t limit,
                       std::vector<MemoryEntry>& out);

    Status load_node(const std::string& project_id, NodeType type,
                     const std::string& key, KnowledgeNode& out);
    Status load_node_by_id(const std::string& node_id, KnowledgeNode& out);
    Status save_node(const KnowledgeNode& node);
    Status append_node_history(const KnowledgeNode& node);
    Status load_node_history(const std::string& node_id, std::vector<KnowledgeNode>& out);
    Status insert_edge(const KnowledgeEdge& edge);
    Status find_edge(const std::string& project_id,
                     const std::string& source_id,
                     const std::string& target_id,
                     const std::string& relation,
                     KnowledgeEdge& out);
    Status load_graph(const std::string& project_id, GraphSnapshot& out);
    Status restore_graph(const std::string& project_id,
                         const std::vector<KnowledgeNode>& nodes,
                         const std::vector<KnowledgeEdge>& edges);

    Status save_snapshot(const GraphSnapshot& snapshot);
    Status load_snapshot(const std::string& snapshot_id, GraphSnapshot& out);
    Status list_snapshots(const std::string& project_id, std::vector<SnapshotInfo>& out);

    Status append_audit(const AuditRecord& record);
    Status list_audit(const std::string& project_id, std::vector<AuditRecord>& out);

private:
    SqliteBackend(const SqliteBackend&);
    SqliteBackend& operator=(const SqliteBackend&);

    class ReadScope;

    sqlite3* write_db_;
    sqlite3* read_db_;          // nullptr for ":memory:"
    std::string path_;

    std::recursive_mutex write_mutex_;
    std::mutex read_mutex_;
    std::atomic<std::thread::id> tx_owner_;
    int tx_depth_;
    bool tx_doomed_;            // An inner scope rolled back

    bool owns_transaction() const;
    Status exec(sqlite3* db, const char* sql);
    Status init_schema();
    Status load_latest_entries(sqlite3* db, const std::string& project_id,
                               bool newest_first, std::vector<MemoryEntry>& out);
};

} // namespace novelforge

#endif // novelforge_STORAGE_SQLITE_BACKEND_HPP
