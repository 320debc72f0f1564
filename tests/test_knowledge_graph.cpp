#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace novelforge;
using namespace novelforge::test;

namespace {

Json attrs(const std::string& key, const Json& value) {
    Json j = Json::object();
    j[key] = value;
    return j;
}

} // namespace

// ============================================================================
// Nodes & edges
// ============================================================================

TEST(KnowledgeGraphTest, UpsertIsIdempotent) {
    Harness h(":memory:");

    KnowledgeNode first;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang",
                                     attrs("status", "alive"), first).ok());
    EXPECT_EQ(first.version, 1);
    EXPECT_EQ(h.graph_version("p"), 1);

    KnowledgeNode again;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang",
                                     attrs("status", "alive"), again).ok());
    EXPECT_EQ(again.id, first.id);
    EXPECT_EQ(again.version, 1);
    EXPECT_EQ(h.graph_version("p"), 1);

    KnowledgeNode changed;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang",
                                     attrs("status", "wounded"), changed).ok());
    EXPECT_EQ(changed.id, first.id);
    EXPECT_EQ(changed.version, 2);
    EXPECT_EQ(h.graph_version("p"), 2);

    std::vector<KnowledgeNode> history;
    ASSERT_TRUE(h.graph->node_history(first.id, history).ok());
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].attributes["status"], "alive");
    EXPECT_EQ(history[1].attributes["status"], "wounded");
}

TEST(KnowledgeGraphTest, MergeNodeAppliesPatch) {
    Harness h(":memory:");
    Json initial = Json::object();
    initial["status"] = "alive";
    initial["weapon"] = "sword";

    KnowledgeNode node;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "wei", initial, node).ok());

    Json patch = Json::object();
    patch["weapon"] = nullptr;
    patch["location"] = "harbor";
    ASSERT_TRUE(h.graph->merge_node("p", NodeType::CHARACTER, "wei", patch, node).ok());

    EXPECT_EQ(node.attributes["status"], "alive");
    EXPECT_EQ(node.attributes["location"], "harbor");
    EXPECT_FALSE(node.attributes.contains("weapon"));
    EXPECT_EQ(node.version, 2);
}

TEST(KnowledgeGraphTest, NodeValidation) {
    Harness h(":memory:");
    KnowledgeNode node;
    EXPECT_EQ(h.graph->upsert_node("p", NodeType::ITEM, " ", Json::object(), node).code,
              ErrorCode::VALIDATION);
    EXPECT_EQ(h.graph->upsert_node("p", NodeType::ITEM, "lamp", Json::array(), node).code,
              ErrorCode::VALIDATION);
    EXPECT_EQ(h.graph->get_node("p", NodeType::ITEM, "lamp", node).code, ErrorCode::NOT_FOUND);
}

TEST(KnowledgeGraphTest, EdgeToMissingNodeFails) {
    Harness h(":memory:");
    KnowledgeNode lihang;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang", Json::object(), lihang).ok());
    int64_t before = h.graph_version("p");

    KnowledgeEdge edge;
    Status s = h.graph->add_edge("p", lihang.id, "missing-node-id", "knows", Json::object(), edge);
    EXPECT_EQ(s.code, ErrorCode::MISSING_NODE);

    s = h.graph->add_edge("p", NodeRef(NodeType::CHARACTER, "lihang"),
                          NodeRef(NodeType::LOCATION, "harbor"), "visits", Json::object(), edge);
    EXPECT_EQ(s.code, ErrorCode::MISSING_NODE);
    EXPECT_EQ(h.graph_version("p"), before);

    // A node of another project is missing too
    KnowledgeNode stranger;
    ASSERT_TRUE(h.graph->upsert_node("q", NodeType::CHARACTER, "stranger", Json::object(), stranger).ok());
    s = h.graph->add_edge("p", lihang.id, stranger.id, "knows", Json::object(), edge);
    EXPECT_EQ(s.code, ErrorCode::MISSING_NODE);
}

TEST(KnowledgeGraphTest, DuplicateEdgeIsNoOp) {
    Harness h(":memory:");
    KnowledgeNode a, b;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang", Json::object(), a).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "wei", Json::object(), b).ok());

    KnowledgeEdge first, second;
    ASSERT_TRUE(h.graph->add_edge("p", a.id, b.id, "rival_of", Json::object(), first).ok());
    int64_t version = h.graph_version("p");
    ASSERT_TRUE(h.graph->add_edge("p", a.id, b.id, "rival_of", Json::object(), second).ok());

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(h.graph_version("p"), version);

    GraphSnapshot snapshot;
    ASSERT_TRUE(h.graph->snapshot("p", snapshot, false).ok());
    EXPECT_EQ(snapshot.edges.size(), 1u);
}

// ============================================================================
// Traversal
// ============================================================================

TEST(KnowledgeGraphTest, SubgraphRespectsDepthOnCycles) {
    Harness h(":memory:");
    KnowledgeNode a, b, c, d;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "a", Json::object(), a).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "b", Json::object(), b).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "c", Json::object(), c).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::LOCATION, "d", Json::object(), d).ok());

    KnowledgeEdge e;
    ASSERT_TRUE(h.graph->add_edge("p", a.id, b.id, "knows", Json::object(), e).ok());
    ASSERT_TRUE(h.graph->add_edge("p", b.id, c.id, "knows", Json::object(), e).ok());
    ASSERT_TRUE(h.graph->add_edge("p", c.id, a.id, "knows", Json::object(), e).ok());
    ASSERT_TRUE(h.graph->add_edge("p", c.id, d.id, "lives_in", Json::object(), e).ok());

    Subgraph sub;
    ASSERT_TRUE(h.graph->query_subgraph("p", std::vector<std::string>(1, "character:a"), 0, sub).ok());
    ASSERT_EQ(sub.nodes.size(), 1u);
    EXPECT_TRUE(sub.edges.empty());

    ASSERT_TRUE(h.graph->query_subgraph("p", std::vector<std::string>(1, "a"), 1, sub).ok());
    EXPECT_EQ(sub.nodes.size(), 3u);       // a, b, c
    EXPECT_EQ(sub.edges.size(), 3u);       // the whole cycle

    ASSERT_TRUE(h.graph->query_subgraph("p", std::vector<std::string>(1, a.id), 5, sub).ok());
    EXPECT_EQ(sub.nodes.size(), 4u);
    EXPECT_EQ(sub.edges.size(), 4u);

    std::vector<std::string> lines = sub.render_facts();
    EXPECT_EQ(lines.size(), 8u);
}

TEST(KnowledgeGraphTest, SubgraphValidation) {
    Harness h(":memory:");
    Subgraph sub;
    EXPECT_EQ(h.graph->query_subgraph("p", std::vector<std::string>(1, "a"), -1, sub).code,
              ErrorCode::VALIDATION);

    ASSERT_TRUE(h.graph->query_subgraph("p", std::vector<std::string>(1, "nobody"), 2, sub).ok());
    EXPECT_TRUE(sub.empty());
}

TEST(KnowledgeGraphTest, RenderFactsHidesBookkeeping) {
    Harness h(":memory:");
    Json a = Json::object();
    a["status"] = "dead";
    a["_established"] = attrs("status", 5);
    KnowledgeNode node;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang", a, node).ok());

    Subgraph sub;
    ASSERT_TRUE(h.graph->query_subgraph("p", std::vector<std::string>(1, "lihang"), 1, sub).ok());
    std::vector<std::string> lines = sub.render_facts();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "character:lihang {\"status\":\"dead\"}");
}

// ============================================================================
// Snapshots
// ============================================================================

TEST(KnowledgeGraphTest, RollbackRestoresSnapshotExactly) {
    Harness h(":memory:");
    KnowledgeNode lihang, harbor;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang",
                                     attrs("status", "alive"), lihang).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::LOCATION, "harbor", Json::object(), harbor).ok());
    KnowledgeEdge edge;
    ASSERT_TRUE(h.graph->add_edge("p", lihang.id, harbor.id, "located_at", Json::object(), edge).ok());

    GraphSnapshot saved;
    ASSERT_TRUE(h.graph->snapshot("p", saved).ok());
    EXPECT_FALSE(saved.id.empty());
    int64_t saved_version = saved.graph_version;

    // Later changes: a new node, a changed node, a new edge
    KnowledgeNode wei, changed;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "wei", Json::object(), wei).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang",
                                     attrs("status", "dead"), changed).ok());
    ASSERT_TRUE(h.graph->add_edge("p", wei.id, lihang.id, "killed", Json::object(), edge).ok());

    int64_t new_version = 0;
    ASSERT_TRUE(h.graph->rollback("p", saved.id, new_version).ok());
    EXPECT_GT(new_version, saved_version);
    EXPECT_EQ(h.graph_version("p"), new_version);

    GraphSnapshot now;
    ASSERT_TRUE(h.graph->snapshot("p", now, false).ok());
    EXPECT_EQ(now.nodes.size(), 2u);
    EXPECT_EQ(now.edges.size(), 1u);
    EXPECT_EQ(now.find_node(NodeType::CHARACTER, "wei"), nullptr);

    const KnowledgeNode* restored = now.find_node(NodeType::CHARACTER, "lihang");
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->id, lihang.id);
    EXPECT_EQ(restored->version, 1);
    EXPECT_EQ(restored->attributes["status"], "alive");

    // History newer than the restored version is gone
    std::vector<KnowledgeNode> history;
    ASSERT_TRUE(h.graph->node_history(lihang.id, history).ok());
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].attributes["status"], "alive");

    std::vector<AuditRecord> audit;
    ASSERT_TRUE(h.graph->audit_log("p", audit).ok());
    ASSERT_EQ(audit.size(), 2u);
    EXPECT_EQ(audit[0].action, "snapshot");
    EXPECT_EQ(audit[1].action, "rollback");
    EXPECT_EQ(audit[1].detail["snapshot_id"], saved.id);
}

TEST(KnowledgeGraphTest, RollbackChecksSnapshotOwnership) {
    Harness h(":memory:");
    KnowledgeNode node;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::ITEM, "lamp", Json::object(), node).ok());

    GraphSnapshot saved;
    ASSERT_TRUE(h.graph->snapshot("p", saved).ok());

    int64_t version = 0;
    EXPECT_EQ(h.graph->rollback("q", saved.id, version).code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(h.graph->rollback("p", "no-such-snapshot", version).code, ErrorCode::NOT_FOUND);

    std::vector<SnapshotInfo> snapshots;
    ASSERT_TRUE(h.graph->list_snapshots("p", snapshots).ok());
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].id, saved.id);

    GraphSnapshot loaded;
    ASSERT_TRUE(h.graph->load_snapshot(saved.id, loaded).ok());
    EXPECT_NE(loaded.find_node(NodeType::ITEM, "lamp"), nullptr);
}

TEST(KnowledgeGraphTest, SnapshotJsonRoundTripKeepsIndex) {
    Harness h(":memory:");
    KnowledgeNode a, b;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang", Json::object(), a).ok());
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::ITEM, "lihang", Json::object(), b).ok());

    GraphSnapshot snapshot;
    ASSERT_TRUE(h.graph->snapshot("p", snapshot, false).ok());
    EXPECT_TRUE(snapshot.id.empty());

    GraphSnapshot copy;
    ASSERT_TRUE(GraphSnapshot::from_json(snapshot.to_json(), copy));
    EXPECT_EQ(copy.find_nodes_by_key("lihang").size(), 2u);
    EXPECT_EQ(copy.resolve_seed("item:lihang").size(), 1u);
    EXPECT_FALSE(GraphSnapshot::from_json(Json::array(), copy));
}

// ============================================================================
// Versions & staged writes
// ============================================================================

TEST(KnowledgeGraphTest, GraphVersionIsMonotonic) {
    Harness h(":memory:");
    int64_t last = h.graph_version("p");
    for (int i = 0; i < 5; ++i) {
        int64_t next = 0;
        ASSERT_TRUE(h.graph->bump_version("p", next).ok());
        EXPECT_EQ(next, last + 1);
        last = next;
    }
    EXPECT_EQ(h.graph_version("other"), 0);
}

TEST(KnowledgeGraphTest, ApplyStagedCreatesNodesAndEdges) {
    Harness h(":memory:");

    StagedChanges staged;
    staged.stage_node(NodeRef(NodeType::EVENT, "duel"), attrs("seq", 3), 0);
    staged.stage_node(NodeRef(NodeType::CHARACTER, "lihang"), attrs("status", "alive"), 0);
    staged.stage_edge(NodeRef(NodeType::EVENT, "duel"), NodeRef(NodeType::CHARACTER, "lihang"),
                      "involves");
    ASSERT_TRUE(h.graph->apply_staged("p", staged, "req-1").ok());

    GraphSnapshot snapshot;
    ASSERT_TRUE(h.graph->snapshot("p", snapshot, false).ok());
    EXPECT_EQ(snapshot.nodes.size(), 2u);
    EXPECT_EQ(snapshot.edges.size(), 1u);

    // Staged writes leave version bumping to the caller
    EXPECT_EQ(h.graph_version("p"), 0);
}

TEST(KnowledgeGraphTest, ApplyStagedEdgeNeedsEndpoints) {
    Harness h(":memory:");
    StagedChanges staged;
    staged.stage_edge(NodeRef(NodeType::CHARACTER, "a"), NodeRef(NodeType::CHARACTER, "b"), "knows");

    Status s = h.graph->apply_staged("p", staged, "req-1");
    EXPECT_EQ(s.code, ErrorCode::MISSING_NODE);
}

TEST(KnowledgeGraphTest, ConcurrentOverwriteIsAudited) {
    Harness h(":memory:");
    KnowledgeNode wei;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "wei",
                                     attrs("location", "harbor"), wei).ok());

    // Two requests checked against version 1; the first commits
    StagedChanges first;
    first.stage_node(NodeRef(NodeType::CHARACTER, "wei"), attrs("location", "palace"), wei.version);
    ASSERT_TRUE(h.graph->apply_staged("p", first, "req-a").ok());

    StagedChanges second;
    second.stage_node(NodeRef(NodeType::CHARACTER, "wei"), attrs("location", "temple"), wei.version);
    ASSERT_TRUE(h.graph->apply_staged("p", second, "req-b").ok());

    KnowledgeNode now;
    ASSERT_TRUE(h.graph->get_node("p", NodeType::CHARACTER, "wei", now).ok());
    EXPECT_EQ(now.attributes["location"], "temple");
    EXPECT_EQ(now.version, 3);

    std::vector<AuditRecord> audit;
    ASSERT_TRUE(h.graph->audit_log("p", audit).ok());
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit[0].action, "conflict");
    EXPECT_EQ(audit[0].detail["request_id"], "req-b");
    EXPECT_EQ(audit[0].detail["overwritten"]["location"], "palace");
    EXPECT_EQ(audit[0].detail["winning"]["location"], "temple");
}
