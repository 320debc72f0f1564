/*
 * NovelForge C++ - Knowledge Graph Implementation
 */
#include <novelforge/graph/knowledge_graph.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

KnowledgeGraph::KnowledgeGraph(StorageBackend& backend, QueryCache* cache)
    : backend_(backend)
    , cache_(cache)
{}

void KnowledgeGraph::invalidate(const std::string& project_id) {
    if (cache_) cache_->invalidate(project_id);
}

// ============================================================================
// Nodes
// ============================================================================

Status KnowledgeGraph::write_node(const std::string& project_id, NodeType type,
                                  const std::string& key, const Json& attributes,
                                  const KnowledgeNode* existing,
                                  KnowledgeNode& out, bool& changed)
{
    changed = false;
    if (existing && existing->attributes == attributes) {
        out = *existing;
        return Status::ok_status();
    }

    KnowledgeNode node;
    if (existing) {
        node = *existing;
        node.version = existing->version + 1;
    } else {
        node.id = generate_uuid();
        node.project_id = project_id;
        node.type = type;
        node.key = key;
        node.version = 1;
    }
    node.attributes = attributes;
    node.updated_at = current_timestamp_ms();
    if (existing && node.updated_at < existing->updated_at) {
        node.updated_at = existing->updated_at;
    }

    Status s = backend_.save_node(node);
    if (!s.ok()) return s;
    s = backend_.append_node_history(node);
    if (!s.ok()) return s;

    LOG_DEBUG("[KnowledgeGraph] %s %s v%d in project %s",
              existing ? "Updated" : "Created", node.ref().c_str(),
              node.version, project_id.c_str());
    out = node;
    changed = true;
    return Status::ok_status();
}

Status KnowledgeGraph::upsert_node(const std::string& project_id, NodeType type,
                                   const std::string& key, const Json& attributes,
                                   KnowledgeNode& out)
{
    if (project_id.empty() || trim(key).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "node needs a project and a key");
    }
    if (!attributes.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "node attributes must be a JSON object");
    }

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    KnowledgeNode existing;
    Status s = backend_.load_node(project_id, type, key, existing);
    if (!s.ok() && s.code != ErrorCode::NOT_FOUND) return s;
    bool found = s.ok();

    bool changed = false;
    s = write_node(project_id, type, key, attributes, found ? &existing : nullptr, out, changed);
    if (!s.ok()) return s;
    if (!changed) return tx.commit();

    int64_t version = 0;
    s = bump_version(project_id, version);
    if (!s.ok()) return s;

    s = tx.commit();
    if (s.ok()) invalidate(project_id);
    return s;
}

Status KnowledgeGraph::merge_node(const std::string& project_id, NodeType type,
                                  const std::string& key, const Json& patch,
                                  KnowledgeNode& out)
{
    if (project_id.empty() || trim(key).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "node needs a project and a key");
    }
    if (!patch.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "node patch must be a JSON object");
    }

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    KnowledgeNode existing;
    Status s = backend_.load_node(project_id, type, key, existing);
    if (!s.ok() && s.code != ErrorCode::NOT_FOUND) return s;
    bool found = s.ok();

    Json merged = found ? existing.attributes : Json::object();
    merged.merge_patch(patch);

    bool changed = false;
    s = write_node(project_id, type, key, merged, found ? &existing : nullptr, out, changed);
    if (!s.ok()) return s;
    if (!changed) return tx.commit();

    int64_t version = 0;
    s = bump_version(project_id, version);
    if (!s.ok()) return s;

    s = tx.commit();
    if (s.ok()) invalidate(project_id);
    return s;
}

Status KnowledgeGraph::get_node(const std::string& project_id, NodeType type,
                                const std::string& key, KnowledgeNode& out)
{
    return backend_.load_node(project_id, type, key, out);
}

Status KnowledgeGraph::get_node_by_id(const std::string& node_id, KnowledgeNode& out) {
    return backend_.load_node_by_id(node_id, out);
}

Status KnowledgeGraph::node_history(const std::string& node_id, std::vector<KnowledgeNode>& out) {
    return backend_.load_node_history(node_id, out);
}

// ============================================================================
// Edges
// ============================================================================

Status KnowledgeGraph::link(const std::string& project_id, const KnowledgeNode& source,
                            const KnowledgeNode& target, const std::string& relation,
                            const Json& attributes, KnowledgeEdge& out, bool& created)
{
    created = false;
    Status s = backend_.find_edge(project_id, source.id, target.id, relation, out);
    if (s.ok()) return s;
    if (s.code != ErrorCode::NOT_FOUND) return s;

    KnowledgeEdge edge;
    edge.id = generate_uuid();
    edge.project_id = project_id;
    edge.source_id = source.id;
    edge.target_id = target.id;
    edge.relation = relation;
    edge.attributes = attributes.is_object() ? attributes : Json::object();
    edge.created_at = current_timestamp_ms();

    s = backend_.insert_edge(edge);
    if (!s.ok()) return s;

    LOG_DEBUG("[KnowledgeGraph] Linked %s -%s-> %s",
              source.ref().c_str(), relation.c_str(), target.ref().c_str());
    out = edge;
    created = true;
    return Status::ok_status();
}

Status KnowledgeGraph::add_edge(const std::string& project_id,
                                const std::string& source_id, const std::string& target_id,
                                const std::string& relation, const Json& attributes,
                                KnowledgeEdge& out)
{
    if (trim(relation).empty()) {
        return Status::fail(ErrorCode::VALIDATION, "edge needs a relation label");
    }

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    KnowledgeNode source, target;
    Status s = backend_.load_node_by_id(source_id, source);
    if (s.code == ErrorCode::NOT_FOUND || (s.ok() && source.project_id != project_id)) {
        return Status::fail(ErrorCode::MISSING_NODE, "edge source does not exist: " + source_id);
    }
    if (!s.ok()) return s;

    s = backend_.load_node_by_id(target_id, target);
    if (s.code == ErrorCode::NOT_FOUND || (s.ok() && target.project_id != project_id)) {
        return Status::fail(ErrorCode::MISSING_NODE, "edge target does not exist: " + target_id);
    }
    if (!s.ok()) return s;

    bool created = false;
    s = link(project_id, source, target, relation, attributes, out, created);
    if (!s.ok()) return s;
    if (!created) return tx.commit();

    int64_t version = 0;
    s = bump_version(project_id, version);
    if (!s.ok()) return s;

    s = tx.commit();
    if (s.ok()) invalidate(project_id);
    return s;
}

Status KnowledgeGraph::add_edge(const std::string& project_id,
                                const NodeRef& source, const NodeRef& target,
                                const std::string& relation, const Json& attributes,
                                KnowledgeEdge& out)
{
    KnowledgeNode source_node, target_node;
    Status s = backend_.load_node(project_id, source.type, source.key, source_node);
    if (s.code == ErrorCode::NOT_FOUND) {
        return Status::fail(ErrorCode::MISSING_NODE, "edge source does not exist: " + source.to_string());
    }
    if (!s.ok()) return s;

    s = backend_.load_node(project_id, target.type, target.key, target_node);
    if (s.code == ErrorCode::NOT_FOUND) {
        return Status::fail(ErrorCode::MISSING_NODE, "edge target does not exist: " + target.to_string());
    }
    if (!s.ok()) return s;

    return add_edge(project_id, source_node.id, target_node.id, relation, attributes, out);
}

// ============================================================================
// Traversal & snapshots
// ============================================================================

Status KnowledgeGraph::query_subgraph(const std::string& project_id,
                                      const std::vector<std::string>& seeds,
                                      int depth, Subgraph& out)
{
    if (depth < 0) {
        return Status::fail(ErrorCode::VALIDATION, "subgraph depth must not be negative");
    }

    GraphSnapshot graph;
    Status s = backend_.load_graph(project_id, graph);
    if (!s.ok()) return s;

    out = graph.subgraph(seeds, depth);
    return Status::ok_status();
}

Status KnowledgeGraph::snapshot(const std::string& project_id, GraphSnapshot& out, bool persist) {
    Status s = backend_.load_graph(project_id, out);
    if (!s.ok()) return s;

    out.created_at = current_timestamp_ms();
    out.id.clear();
    if (!persist) return Status::ok_status();

    out.id = generate_uuid();

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    s = backend_.save_snapshot(out);
    if (!s.ok()) return s;

    AuditRecord record;
    record.project_id = project_id;
    record.action = "snapshot";
    record.detail["snapshot_id"] = out.id;
    record.detail["graph_version"] = out.graph_version;
    record.detail["nodes"] = static_cast<uint64_t>(out.nodes.size());
    record.detail["edges"] = static_cast<uint64_t>(out.edges.size());
    record.created_at = out.created_at;
    s = backend_.append_audit(record);
    if (!s.ok()) return s;

    s = tx.commit();
    if (s.ok()) {
        LOG_INFO("[KnowledgeGraph] Snapshot %s of project %s at graph version %lld",
                 out.id.c_str(), project_id.c_str(), static_cast<long long>(out.graph_version));
    }
    return s;
}

Status KnowledgeGraph::load_snapshot(const std::string& snapshot_id, GraphSnapshot& out) {
    return backend_.load_snapshot(snapshot_id, out);
}

Status KnowledgeGraph::list_snapshots(const std::string& project_id, std::vector<SnapshotInfo>& out) {
    return backend_.list_snapshots(project_id, out);
}

Status KnowledgeGraph::rollback(const std::string& project_id, const std::string& snapshot_id,
                                int64_t& new_version)
{
    GraphSnapshot target;
    Status s = backend_.load_snapshot(snapshot_id, target);
    if (!s.ok()) return s;
    if (target.project_id != project_id) {
        return Status::fail(ErrorCode::NOT_FOUND,
                            "snapshot " + snapshot_id + " does not belong to project " + project_id);
    }

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    int64_t before = 0;
    s = backend_.get_graph_version(project_id, before);
    if (!s.ok()) return s;

    s = backend_.restore_graph(project_id, target.nodes, target.edges);
    if (!s.ok()) return s;

    s = bump_version(project_id, new_version);
    if (!s.ok()) return s;

    AuditRecord record;
    record.project_id = project_id;
    record.action = "rollback";
    record.detail["snapshot_id"] = snapshot_id;
    record.detail["snapshot_graph_version"] = target.graph_version;
    record.detail["from_graph_version"] = before;
    record.detail["to_graph_version"] = new_version;
    record.created_at = current_timestamp_ms();
    s = backend_.append_audit(record);
    if (!s.ok()) return s;

    s = tx.commit();
    if (!s.ok()) return s;

    invalidate(project_id);
    LOG_INFO("[KnowledgeGraph] Project %s rolled back to snapshot %s (graph version %lld -> %lld)",
             project_id.c_str(), snapshot_id.c_str(),
             static_cast<long long>(before), static_cast<long long>(new_version));
    return Status::ok_status();
}

Status KnowledgeGraph::graph_version(const std::string& project_id, int64_t& version) {
    return backend_.get_graph_version(project_id, version);
}

Status KnowledgeGraph::bump_version(const std::string& project_id, int64_t& new_version) {
    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    int64_t current = 0;
    Status s = backend_.get_graph_version(project_id, current);
    if (!s.ok()) return s;

    s = backend_.set_graph_version(project_id, current + 1);
    if (!s.ok()) return s;

    s = tx.commit();
    if (s.ok()) new_version = current + 1;
    return s;
}

// ============================================================================
// Staged changes
// ============================================================================

Status KnowledgeGraph::record_conflict(const std::string& project_id, const StagedNode& staged,
                                       const KnowledgeNode& current, const std::string& request_id)
{
    Json overwritten = Json::object();
    Json winning = Json::object();
    for (Json::const_iterator it = staged.patch.begin(); it != staged.patch.end(); ++it) {
        if (it.key() == "_established") continue;
        Json::const_iterator old = current.attributes.find(it.key());
        if (old != current.attributes.end() && *old != it.value()) {
            overwritten[it.key()] = *old;
            winning[it.key()] = it.value();
        }
    }
    if (overwritten.empty()) return Status::ok_status();

    LOG_WARN("[KnowledgeGraph] Request %s overwrites %s (checked at v%d, now v%d)",
             request_id.c_str(), current.ref().c_str(), staged.base_version, current.version);

    AuditRecord record;
    record.project_id = project_id;
    record.action = "conflict";
    record.detail["request_id"] = request_id;
    record.detail["node"] = current.ref();
    record.detail["node_id"] = current.id;
    record.detail["base_version"] = staged.base_version;
    record.detail["current_version"] = current.version;
    record.detail["overwritten"] = overwritten;
    record.detail["winning"] = winning;
    record.created_at = current_timestamp_ms();
    return backend_.append_audit(record);
}

Status KnowledgeGraph::apply_staged(const std::string& project_id, const StagedChanges& staged,
                                    const std::string& request_id)
{
    if (staged.empty()) return Status::ok_status();

    TransactionGuard tx(backend_);
    if (!tx.status().ok()) return tx.status();

    for (size_t i = 0; i < staged.nodes.size(); ++i) {
        const StagedNode& change = staged.nodes[i];

        KnowledgeNode existing;
        Status s = backend_.load_node(project_id, change.ref.type, change.ref.key, existing);
        if (!s.ok() && s.code != ErrorCode::NOT_FOUND) return s;
        bool found = s.ok();

        if (found && existing.version != change.base_version) {
            s = record_conflict(project_id, change, existing, request_id);
            if (!s.ok()) return s;
        }

        Json merged = found ? existing.attributes : Json::object();
        merged.merge_patch(change.patch);

        KnowledgeNode written;
        bool changed = false;
        s = write_node(project_id, change.ref.type, change.ref.key, merged,
                       found ? &existing : nullptr, written, changed);
        if (!s.ok()) return s;
    }

    for (size_t i = 0; i < staged.edges.size(); ++i) {
        const StagedEdge& change = staged.edges[i];

        KnowledgeNode source, target;
        Status s = backend_.load_node(project_id, change.source.type, change.source.key, source);
        if (s.code == ErrorCode::NOT_FOUND) {
            return Status::fail(ErrorCode::MISSING_NODE,
                                "staged edge source does not exist: " + change.source.to_string());
        }
        if (!s.ok()) return s;

        s = backend_.load_node(project_id, change.target.type, change.target.key, target);
        if (s.code == ErrorCode::NOT_FOUND) {
            return Status::fail(ErrorCode::MISSING_NODE,
                                "staged edge target does not exist: " + change.target.to_string());
        }
        if (!s.ok()) return s;

        KnowledgeEdge edge;
        bool created = false;
        s = link(project_id, source, target, change.relation, change.attributes, edge, created);
        if (!s.ok()) return s;
    }

    Status s = tx.commit();
    if (s.ok()) invalidate(project_id);
    return s;
}

Status KnowledgeGraph::audit_log(const std::string& project_id, std::vector<AuditRecord>& out) {
    return backend_.list_audit(project_id, out);
}

} // namespace novelforge
