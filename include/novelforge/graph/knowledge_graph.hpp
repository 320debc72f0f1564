/*
 * NovelForge C++ - Knowledge Graph
 *
 * Versioned entity graph per project, persisted through a StorageBackend.
 *
 * - Nodes are unique on (project, type, key). Writing identical attributes
 *   is a no-op; anything else creates the next node version and records it
 *   in the node history.
 * - Edges are unique on (source, target, relation) and never dangle.
 * - Every standalone mutation bumps the project graph version.
 *   apply_staged() does not: it runs inside a request commit, which bumps
 *   the version once.
 *
 * Event nodes carry "seq", "event_kind" and "flashback" attributes; their
 * participants are "involves" edges from the event to each character.
 */
#ifndef novelforge_GRAPH_KNOWLEDGE_GRAPH_HPP
#define novelforge_GRAPH_KNOWLEDGE_GRAPH_HPP

#include <novelforge/graph/types.hpp>
#include <novelforge/consistency/facts.hpp>
#include <novelforge/storage/backend.hpp>
#include <novelforge/memory/query_cache.hpp>

namespace novelforge {

class KnowledgeGraph {
public:
    explicit KnowledgeGraph(StorageBackend& backend, QueryCache* cache = nullptr);

    // Replace the node's attributes
    Status upsert_node(const std::string& project_id, NodeType type, const std::string& key,
                       const Json& attributes, KnowledgeNode& out);
    // Merge a patch (RFC 7386: null removes an attribute) into the node
    Status merge_node(const std::string& project_id, NodeType type, const std::string& key,
                      const Json& patch, KnowledgeNode& out);

    // MISSING_NODE when an endpoint does not exist in the project.
    // Re-adding an existing (source, target, relation) returns that edge.
    Status add_edge(const std::string& project_id,
                    const std::string& source_id, const std::string& target_id,
                    const std::string& relation, const Json& attributes,
                    KnowledgeEdge& out);
    Status add_edge(const std::string& project_id,
                    const NodeRef& source, const NodeRef& target,
                    const std::string& relation, const Json& attributes,
                    KnowledgeEdge& out);

    Status get_node(const std::string& project_id, NodeType type, const std::string& key,
                    KnowledgeNode& out);
    Status get_node_by_id(const std::string& node_id, KnowledgeNode& out);
    Status node_history(const std::string& node_id, std::vector<KnowledgeNode>& out);

    // Seeds are "type:key", bare keys (any type) or node ids
    Status query_subgraph(const std::string& project_id,
                          const std::vector<std::string>& seeds,
                          int depth, Subgraph& out);

    // Full copy of the graph. With persist, the snapshot gets an id, is
    // stored and audited; without, it is a request-local view.
    Status snapshot(const std::string& project_id, GraphSnapshot& out, bool persist = true);
    Status load_snapshot(const std::string& snapshot_id, GraphSnapshot& out);
    Status list_snapshots(const std::string& project_id, std::vector<SnapshotInfo>& out);

    // Restore nodes and edges exactly as captured, discard later node
    // history, bump the graph version. new_version receives the result.
    Status rollback(const std::string& project_id, const std::string& snapshot_id,
                    int64_t& new_version);

    Status graph_version(const std::string& project_id, int64_t& version);
    Status bump_version(const std::string& project_id, int64_t& new_version);

    // Apply checker output inside the caller's transaction. Node patches
    // first, then edges (MISSING_NODE if an endpoint is still absent).
    // When a node moved past the version the checker saw, the patch still
    // wins and the overwritten values are written to the audit log.
    Status apply_staged(const std::string& project_id, const StagedChanges& staged,
                        const std::string& request_id);

    Status audit_log(const std::string& project_id, std::vector<AuditRecord>& out);

private:
    StorageBackend& backend_;
    QueryCache* cache_;

    // Write attributes as the node's next version unless unchanged
    Status write_node(const std::string& project_id, NodeType type, const std::string& key,
                      const Json& attributes, const KnowledgeNode* existing,
                      KnowledgeNode& out, bool& changed);
    Status link(const std::string& project_id, const KnowledgeNode& source,
                const KnowledgeNode& target, const std::string& relation,
                const Json& attributes, KnowledgeEdge& out, bool& created);
    Status record_conflict(const std::string& project_id, const StagedNode& staged,
                           const KnowledgeNode& current, const std::string& request_id);
    void invalidate(const std::string& project_id);
};

} // namespace novelforge

#endif // novelforge_GRAPH_KNOWLEDGE_GRAPH_HPP
