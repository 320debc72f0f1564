#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace novelforge;
using namespace novelforge::test;

namespace {

MemoryEntry entry_for(const std::string& project, const std::string& content,
                      MemoryKind kind = MemoryKind::EVENT)
{
    MemoryEntry entry;
    entry.project_id = project;
    entry.kind = kind;
    entry.content = content;
    return entry;
}

} // namespace

// ============================================================================
// Add & query
// ============================================================================

TEST(MemoryStoreTest, AddedEntryIsTopHitForItsOwnText) {
    Harness h(":memory:");
    ASSERT_TRUE(h.open_status.ok());

    MemoryEntry duel = entry_for("p", "Lihang fought Wei on the harbor wall at dawn.");
    MemoryEntry tea = entry_for("p", "The tea house in the capital served plum wine.");
    ASSERT_TRUE(h.memory->add(duel).ok());
    ASSERT_TRUE(h.memory->add(tea).ok());

    EXPECT_FALSE(duel.id.empty());
    EXPECT_EQ(duel.root_id, duel.id);
    EXPECT_EQ(duel.version, 1);
    EXPECT_GT(duel.created_at, 0);

    std::vector<MemoryHit> hits;
    Status s = h.memory->query("p", "Lihang fought Wei on the harbor wall at dawn.",
                               MemoryFilter(), 5, hits);
    ASSERT_TRUE(s.ok()) << s.to_string();
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].entry.id, duel.id);
    EXPECT_NEAR(hits[0].similarity, 1.0, 1e-5);
    EXPECT_GE(hits[0].similarity, hits[1].similarity);
}

TEST(MemoryStoreTest, QueryIsScopedToProject) {
    Harness h(":memory:");
    MemoryEntry mine = entry_for("p", "The sword was forged in the northern mountains.");
    MemoryEntry theirs = entry_for("q", "The sword was forged in the northern mountains.");
    ASSERT_TRUE(h.memory->add(mine).ok());
    ASSERT_TRUE(h.memory->add(theirs).ok());

    std::vector<MemoryHit> hits;
    ASSERT_TRUE(h.memory->query("p", "forged sword", MemoryFilter(), 10, hits).ok());
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].entry.id, mine.id);
}

TEST(MemoryStoreTest, QueryValidatesArguments) {
    Harness h(":memory:");
    std::vector<MemoryHit> hits;
    EXPECT_EQ(h.memory->query("p", "anything", MemoryFilter(), 0, hits).code, ErrorCode::VALIDATION);
    EXPECT_EQ(h.memory->query("p", "   ", MemoryFilter(), 3, hits).code, ErrorCode::VALIDATION);
}

TEST(MemoryStoreTest, EmptyProjectReturnsNoHits) {
    Harness h(":memory:");
    std::vector<MemoryHit> hits;
    ASSERT_TRUE(h.memory->query("empty", "who is lihang", MemoryFilter(), 3, hits).ok());
    EXPECT_TRUE(hits.empty());
}

TEST(MemoryStoreTest, AddRejectsBadEntries) {
    Harness h(":memory:");

    MemoryEntry no_project = entry_for("", "content");
    EXPECT_EQ(h.memory->add(no_project).code, ErrorCode::VALIDATION);

    MemoryEntry blank = entry_for("p", "  \n");
    EXPECT_EQ(h.memory->add(blank).code, ErrorCode::VALIDATION);

    MemoryEntry bad_metadata = entry_for("p", "content");
    bad_metadata.metadata = Json::array();
    EXPECT_EQ(h.memory->add(bad_metadata).code, ErrorCode::VALIDATION);
    EXPECT_EQ(h.entry_count("p"), 0u);
}

TEST(MemoryStoreTest, FilterByKindAndMetadata) {
    Harness h(":memory:");
    MemoryEntry event = entry_for("p", "Lihang crossed the river.", MemoryKind::EVENT);
    event.metadata["chapter"] = 1;
    MemoryEntry world = entry_for("p", "Rivers in this land flow uphill.", MemoryKind::WORLDBUILDING);
    world.metadata["chapter"] = 2;
    ASSERT_TRUE(h.memory->add(event).ok());
    ASSERT_TRUE(h.memory->add(world).ok());

    MemoryFilter worldbuilding;
    worldbuilding.kinds.push_back(MemoryKind::WORLDBUILDING);
    std::vector<MemoryHit> hits;
    ASSERT_TRUE(h.memory->query("p", "river", worldbuilding, 5, hits).ok());
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].entry.id, world.id);

    MemoryFilter chapter_one;
    chapter_one.metadata_equals["chapter"] = 1;
    ASSERT_TRUE(h.memory->query("p", "river", chapter_one, 5, hits).ok());
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].entry.id, event.id);
}

TEST(MemoryStoreTest, WritesInvalidateCachedQueries) {
    Harness h(":memory:");
    MemoryEntry first = entry_for("p", "A storm rolled over the harbor.");
    ASSERT_TRUE(h.memory->add(first).ok());

    std::vector<MemoryHit> hits;
    ASSERT_TRUE(h.memory->query("p", "storm harbor", MemoryFilter(), 5, hits).ok());
    EXPECT_EQ(hits.size(), 1u);
    int calls = h.embedder.calls;

    // Served from the cache: no embedding call
    ASSERT_TRUE(h.memory->query("p", "storm harbor", MemoryFilter(), 5, hits).ok());
    EXPECT_EQ(h.embedder.calls.load(), calls);

    MemoryEntry second = entry_for("p", "The storm sank two ships in the harbor.");
    ASSERT_TRUE(h.memory->add(second).ok());
    ASSERT_TRUE(h.memory->query("p", "storm harbor", MemoryFilter(), 5, hits).ok());
    EXPECT_EQ(hits.size(), 2u);
}

// ============================================================================
// Versions
// ============================================================================

TEST(MemoryStoreTest, UpdateAppendsVersionAndKeepsHistory) {
    Harness h(":memory:");
    MemoryEntry entry = entry_for("p", "Wei is a merchant.", MemoryKind::CHARACTER_STATE);
    entry.metadata["character"] = "wei";
    ASSERT_TRUE(h.memory->add(entry).ok());

    MemoryEntry v2;
    ASSERT_TRUE(h.memory->update(entry.id, "Wei is a spy posing as a merchant.", v2).ok());
    EXPECT_EQ(v2.version, 2);
    EXPECT_EQ(v2.root_id, entry.id);
    EXPECT_EQ(v2.previous_id, entry.id);
    EXPECT_EQ(v2.metadata["character"], "wei");
    EXPECT_GE(v2.created_at, entry.created_at);

    MemoryEntry latest;
    ASSERT_TRUE(h.memory->get(entry.id, latest).ok());
    EXPECT_EQ(latest.id, v2.id);

    MemoryEntry first;
    ASSERT_TRUE(h.memory->get_version(v2.id, 1, first).ok());
    EXPECT_EQ(first.content, "Wei is a merchant.");
    EXPECT_EQ(h.memory->get_version(entry.id, 7, first).code, ErrorCode::NOT_FOUND);

    std::vector<MemoryEntry> chain;
    ASSERT_TRUE(h.memory->history(entry.id, chain).ok());
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[0].version, 1);
    EXPECT_EQ(chain[1].version, 2);

    // Queries only see the latest version of a chain
    std::vector<MemoryHit> hits;
    ASSERT_TRUE(h.memory->query("p", "Wei merchant", MemoryFilter(), 5, hits).ok());
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].entry.id, v2.id);
}

TEST(MemoryStoreTest, RollbackVersionRestoresPrevious) {
    Harness h(":memory:");
    MemoryEntry entry = entry_for("p", "The gate is guarded by two soldiers.");
    ASSERT_TRUE(h.memory->add(entry).ok());

    MemoryEntry v2;
    ASSERT_TRUE(h.memory->update(entry.id, "The gate is unguarded at night.", v2).ok());

    MemoryEntry restored;
    ASSERT_TRUE(h.memory->rollback_version(v2.id, restored).ok());
    EXPECT_EQ(restored.id, entry.id);
    EXPECT_EQ(restored.version, 1);

    MemoryEntry latest;
    ASSERT_TRUE(h.memory->get(entry.id, latest).ok());
    EXPECT_EQ(latest.content, "The gate is guarded by two soldiers.");

    // A single-version chain has nothing to roll back to
    Status s = h.memory->rollback_version(entry.id, restored);
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);
    EXPECT_EQ(h.memory->get("no-such-entry", latest).code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// Cross-references
// ============================================================================

TEST(MemoryStoreTest, DanglingNodeRefIsRejected) {
    Harness h(":memory:");
    MemoryEntry entry = entry_for("p", "Lihang drew his sword.");
    entry.metadata["node_refs"] = Json::array({"character:lihang"});

    Status s = h.memory->add(entry);
    EXPECT_EQ(s.code, ErrorCode::REFERENCE);
    EXPECT_EQ(h.entry_count("p"), 0u);

    KnowledgeNode node;
    ASSERT_TRUE(h.graph->upsert_node("p", NodeType::CHARACTER, "lihang", Json::object(), node).ok());
    MemoryEntry retry = entry_for("p", "Lihang drew his sword.");
    retry.metadata["node_refs"] = Json::array({"character:lihang", node.id});
    EXPECT_TRUE(h.memory->add(retry).ok());
}

TEST(MemoryStoreTest, AutoCreatePolicyAddsPlaceholderNodes) {
    Harness h(":memory:", OrchestratorConfig(), ReferencePolicy::AUTO_CREATE);
    MemoryEntry entry = entry_for("p", "The Jade Pavilion stood empty.");
    entry.metadata["node_refs"] = Json::array({"location:jade_pavilion"});
    ASSERT_TRUE(h.memory->add(entry).ok());

    KnowledgeNode node;
    ASSERT_TRUE(h.graph->get_node("p", NodeType::LOCATION, "jade_pavilion", node).ok());
    EXPECT_EQ(node.attributes["placeholder"], true);

    // Bare node ids are never created on demand
    MemoryEntry by_id = entry_for("p", "Something else.");
    by_id.metadata["node_refs"] = Json::array({"not-a-node-id"});
    EXPECT_EQ(h.memory->add(by_id).code, ErrorCode::REFERENCE);
}

// ============================================================================
// Embedding failures
// ============================================================================

TEST(MemoryStoreTest, TransientEmbeddingFailuresAreRetried) {
    Harness h(":memory:");
    h.embedder.transient_failures = 2;

    MemoryEntry entry = entry_for("p", "Snow covered the mountain pass.");
    Status s = h.memory->add(entry);
    ASSERT_TRUE(s.ok()) << s.to_string();
    EXPECT_EQ(h.embedder.calls.load(), 3);
    EXPECT_EQ(h.entry_count("p"), 1u);
}

TEST(MemoryStoreTest, PermanentEmbeddingFailureLeavesStoreUntouched) {
    Harness h(":memory:");
    h.embedder.permanent_failure = true;

    MemoryEntry entry = entry_for("p", "Snow covered the mountain pass.");
    Status s = h.memory->add(entry);
    EXPECT_EQ(s.code, ErrorCode::EMBEDDING);
    EXPECT_EQ(h.embedder.calls.load(), 1);

    h.embedder.permanent_failure = false;
    EXPECT_EQ(h.entry_count("p"), 0u);
}

TEST(MemoryStoreTest, DimensionIsFixedByFirstEntry) {
    Harness h(":memory:");
    MemoryEntry first = entry_for("p", "First entry.");
    ASSERT_TRUE(h.memory->add(first).ok());

    int dimension = 0;
    ASSERT_TRUE(h.backend.get_embedding_dimension("p", dimension).ok());
    EXPECT_EQ(dimension, 64);

    MemoryEntry odd = entry_for("p", "Precomputed vector of the wrong size.");
    odd.embedding.assign(32, 0.5f);
    EXPECT_EQ(h.memory->add(odd).code, ErrorCode::EMBEDDING);
}

TEST(MemoryStoreTest, RecentListsNewestFirst) {
    Harness h(":memory:");
    for (int i = 1; i <= 3; ++i) {
        MemoryEntry entry = entry_for("p", "Chapter " + std::to_string(i) + " ends.");
        ASSERT_TRUE(h.memory->add(entry).ok());
    }

    std::vector<MemoryEntry> recent;
    ASSERT_TRUE(h.memory->recent("p", MemoryFilter(), 2, recent).ok());
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].content, "Chapter 3 ends.");
    EXPECT_EQ(recent[1].content, "Chapter 2 ends.");

    ASSERT_TRUE(h.memory->recent("p", MemoryFilter(), 0, recent).ok());
    EXPECT_TRUE(recent.empty());
}
