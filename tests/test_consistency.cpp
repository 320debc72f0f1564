#include <gtest/gtest.h>

#include <novelforge/consistency/checker.hpp>
#include <novelforge/consistency/facts.hpp>

using namespace novelforge;

namespace {

KnowledgeNode node(const std::string& id, NodeType type, const std::string& key,
                   const Json& attributes, int version = 1) {
    KnowledgeNode n;
    n.id = id;
    n.project_id = "novel";
    n.type = type;
    n.key = key;
    n.attributes = attributes;
    n.version = version;
    return n;
}

KnowledgeEdge involves(const std::string& event_id, const std::string& character_id) {
    KnowledgeEdge e;
    e.id = event_id + "-" + character_id;
    e.project_id = "novel";
    e.source_id = event_id;
    e.target_id = character_id;
    e.relation = "involves";
    return e;
}

// Lihang died at seq 5; Wei has been at the palace since seq 3 and met
// someone at seq 6; the magic rule costs blood.
GraphSnapshot story_snapshot() {
    GraphSnapshot snapshot;
    snapshot.project_id = "novel";
    snapshot.graph_version = 4;

    snapshot.nodes.push_back(node("n-lihang", NodeType::CHARACTER, "lihang",
        Json::parse("{\"status\":\"dead\",\"_established\":{\"status\":5}}"), 2));
    snapshot.nodes.push_back(node("n-wei", NodeType::CHARACTER, "wei",
        Json::parse("{\"location\":\"palace\",\"_established\":{\"location\":3}}"), 1));
    snapshot.nodes.push_back(node("n-death", NodeType::EVENT, "death_lihang_5",
        Json::parse("{\"event_kind\":\"death\",\"seq\":5}")));
    snapshot.nodes.push_back(node("n-meet", NodeType::EVENT, "meeting_wei_6",
        Json::parse("{\"event_kind\":\"meeting\",\"seq\":6}")));
    snapshot.nodes.push_back(node("n-magic", NodeType::RULE, "magic_cost",
        Json::parse("{\"value\":\"blood\"}")));

    snapshot.edges.push_back(involves("n-death", "n-lihang"));
    snapshot.edges.push_back(involves("n-meet", "n-wei"));
    snapshot.build_index();
    return snapshot;
}

std::vector<CandidateFact> one(const CandidateFact& fact) {
    return std::vector<CandidateFact>(1, fact);
}

std::vector<std::string> names(const char* a, const char* b = nullptr) {
    std::vector<std::string> out(1, a);
    if (b) out.push_back(b);
    return out;
}

const ConsistencyFinding* find_kind(const CheckResult& result, FindingKind kind) {
    for (size_t i = 0; i < result.findings.size(); ++i) {
        if (result.findings[i].kind == kind) return &result.findings[i];
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Dead characters
// ============================================================================

TEST(ConsistencyCheckerTest, DeadCharacterCannotAct) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult result = checker.check("req-1", one(CandidateFact::event("action", names("lihang"), 7)),
                                       snapshot, 7);
    ASSERT_TRUE(result.has_blocking());
    const ConsistencyFinding* finding = find_kind(result, FindingKind::DEAD_CHARACTER_ACTIVE);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->severity, Severity::BLOCKING);
    EXPECT_EQ(finding->content_ref, "req-1");
    ASSERT_EQ(finding->conflicting_refs.size(), 1u);
    EXPECT_EQ(finding->conflicting_refs[0], "n-death");
    EXPECT_TRUE(result.staged.empty());
}

TEST(ConsistencyCheckerTest, FlashbackMayShowTheDead) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult result = checker.check("req-1",
        one(CandidateFact::event("action", names("lihang"), 7, true)), snapshot, 7);
    EXPECT_FALSE(result.has_blocking());

    const StagedNode* event = result.staged.find_node(NodeRef(NodeType::EVENT, "action_lihang_7"));
    ASSERT_NE(event, nullptr);
    EXPECT_EQ(event->patch["flashback"], true);
    EXPECT_EQ(event->patch["seq"], 7);
    ASSERT_EQ(result.staged.edges.size(), 1u);
    EXPECT_EQ(result.staged.edges[0].target, NodeRef(NodeType::CHARACTER, "lihang"));
}

TEST(ConsistencyCheckerTest, StateChangesOfTheDeadAreBlocked) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult moved = checker.check("req-1",
        one(CandidateFact::character_state("lihang", Json::parse("{\"mood\":\"calm\"}"), 7)),
        snapshot, 7);
    EXPECT_TRUE(moved.has_blocking());

    // Restating the death is not the dead character doing something
    CheckResult restated = checker.check("req-1",
        one(CandidateFact::character_state("lihang", Json::parse("{\"status\":\"dead\"}"), 9)),
        snapshot, 9);
    EXPECT_FALSE(restated.has_blocking());
    EXPECT_TRUE(restated.findings.empty());
}

TEST(ConsistencyCheckerTest, ActionAtTheDeathSeqIsAllowed) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult result = checker.check("req-1",
        one(CandidateFact::event("duel", names("lihang", "wei"), 5)), snapshot, 5);
    EXPECT_FALSE(result.has_blocking());
}

TEST(ConsistencyCheckerTest, StatusWithoutDeathEventStillCounts) {
    GraphSnapshot snapshot = story_snapshot();
    snapshot.nodes.push_back(node("n-ghost", NodeType::CHARACTER, "ghost",
        Json::parse("{\"status\":\"dead\",\"_established\":{\"status\":2}}")));
    snapshot.build_index();

    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1",
        one(CandidateFact::event("action", names("ghost"), 3)), snapshot, 3);
    const ConsistencyFinding* finding = find_kind(result, FindingKind::DEAD_CHARACTER_ACTIVE);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->conflicting_refs[0], "n-ghost");
}

// ============================================================================
// Character state
// ============================================================================

TEST(ConsistencyCheckerTest, ContradictionOfEstablishedFact) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult result = checker.check("req-1",
        one(CandidateFact::character_state("wei", Json::parse("{\"location\":\"temple\"}"), 3)),
        snapshot, 3);
    const ConsistencyFinding* finding = find_kind(result, FindingKind::CONTRADICTION);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->severity, Severity::BLOCKING);
    EXPECT_EQ(finding->conflicting_refs[0], "character:wei");
    EXPECT_TRUE(result.staged.empty());
}

TEST(ConsistencyCheckerTest, LaterTransitionIsStaged) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult result = checker.check("req-1",
        one(CandidateFact::character_state("wei", Json::parse("{\"location\":\"temple\"}"), 4)),
        snapshot, 4);
    EXPECT_FALSE(result.has_blocking());
    const ConsistencyFinding* finding = find_kind(result, FindingKind::STATE_TRANSITION);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->severity, Severity::INFO);

    const StagedNode* wei = result.staged.find_node(NodeRef(NodeType::CHARACTER, "wei"));
    ASSERT_NE(wei, nullptr);
    EXPECT_EQ(wei->patch["location"], "temple");
    EXPECT_EQ(wei->patch["_established"]["location"], 4);
    EXPECT_EQ(wei->base_version, 1);
}

TEST(ConsistencyCheckerTest, FlashbackStateIsNotApplied) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CandidateFact fact = CandidateFact::character_state("wei", Json::parse("{\"location\":\"village\"}"), 1);
    fact.flashback = true;
    CheckResult result = checker.check("req-1", one(fact), snapshot, 8);
    EXPECT_FALSE(result.has_blocking());
    EXPECT_EQ(result.count(Severity::INFO), 1u);
    EXPECT_TRUE(result.staged.empty());
}

TEST(ConsistencyCheckerTest, NewAttributesAndCharactersAreStaged) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    std::vector<CandidateFact> facts;
    facts.push_back(CandidateFact::character_state("wei", Json::parse("{\"mood\":\"wary\"}"), 8));
    facts.push_back(CandidateFact::character_state("mei", Json::parse("{\"mood\":\"happy\"}"), 8));
    CheckResult result = checker.check("req-1", facts, snapshot, 8);

    EXPECT_FALSE(result.has_blocking());
    ASSERT_NE(find_kind(result, FindingKind::REFINEMENT), nullptr);

    const StagedNode* mei = result.staged.find_node(NodeRef(NodeType::CHARACTER, "mei"));
    ASSERT_NE(mei, nullptr);
    EXPECT_EQ(mei->base_version, 0);
    EXPECT_EQ(mei->patch["_established"]["mood"], 8);
}

// ============================================================================
// Rules, events, relations
// ============================================================================

TEST(ConsistencyCheckerTest, RuleRestatedDifferentlyIsBlocking) {
    GraphSnapshot snapshot = story_snapshot();
    ConsistencyChecker checker;

    CheckResult violated = checker.check("req-1", one(CandidateFact::rule("magic_cost", "gold")),
                                         snapshot, 8);
    const ConsistencyFinding* finding = find_kind(violated, FindingKind::RULE_VIOLATION);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->conflicting_refs[0], "rule:magic_cost");

    CheckResult same = checker.check("req-1", one(CandidateFact::rule("magic_cost", "blood")),
                                     snapshot, 8);
    EXPECT_TRUE(same.findings.empty());
    EXPECT_TRUE(same.staged.empty());

    CheckResult novel = checker.check("req-1", one(CandidateFact::rule("no_flight", true)),
                                      snapshot, 8);
    EXPECT_TRUE(novel.findings.empty());
    ASSERT_NE(novel.staged.find_node(NodeRef(NodeType::RULE, "no_flight")), nullptr);
}

TEST(ConsistencyCheckerTest, UnknownKindIsAWarning) {
    CandidateFact fact;
    ASSERT_TRUE(CandidateFact::from_json(Json::parse("{\"kind\":\"weather\",\"sky\":\"grey\"}"), fact).ok());
    EXPECT_EQ(fact.kind(), FactKind::UNKNOWN);

    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1", one(fact), story_snapshot(), 8);
    EXPECT_FALSE(result.has_blocking());
    const ConsistencyFinding* finding = find_kind(result, FindingKind::UNKNOWN_FACT);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->severity, Severity::WARNING);
    EXPECT_TRUE(result.staged.empty());
}

TEST(ConsistencyCheckerTest, TimelineRegressionIsAWarning) {
    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1",
        one(CandidateFact::event("action", names("wei"), 4)), story_snapshot(), 4);

    EXPECT_FALSE(result.has_blocking());
    const ConsistencyFinding* finding = find_kind(result, FindingKind::TIMELINE_REGRESSION);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->severity, Severity::WARNING);
    EXPECT_NE(result.staged.find_node(NodeRef(NodeType::EVENT, "action_wei_4")), nullptr);
}

TEST(ConsistencyCheckerTest, DeathEarlierInBatchBlocksLaterAction) {
    std::vector<CandidateFact> facts;
    facts.push_back(CandidateFact::event("death", names("mei"), 3));
    facts.push_back(CandidateFact::event("action", names("mei"), 4));

    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1", facts, story_snapshot(), 4);

    const ConsistencyFinding* finding = find_kind(result, FindingKind::DEAD_CHARACTER_ACTIVE);
    ASSERT_NE(finding, nullptr);
    EXPECT_EQ(finding->conflicting_refs[0], "event:death_mei_3");

    const StagedNode* mei = result.staged.find_node(NodeRef(NodeType::CHARACTER, "mei"));
    ASSERT_NE(mei, nullptr);
    EXPECT_EQ(mei->patch["status"], "dead");
    EXPECT_EQ(mei->patch["_established"]["status"], 3);
}

TEST(ConsistencyCheckerTest, EventKeysAreSanitized) {
    CandidateFact fact = CandidateFact::event("meeting", names("wei", "mei"), 9);
    std::get<EventFact>(fact.payload).key = "Duel at Dawn!";

    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1", one(fact), story_snapshot(), 9);
    EXPECT_NE(result.staged.find_node(NodeRef(NodeType::EVENT, "duel_at_dawn")), nullptr);
    EXPECT_NE(result.staged.find_node(NodeRef(NodeType::CHARACTER, "mei")), nullptr);
    EXPECT_EQ(result.staged.edges.size(), 2u);
}

TEST(ConsistencyCheckerTest, RelationStagesMissingEndpoints) {
    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1",
        one(CandidateFact::relation(NodeRef(NodeType::CHARACTER, "wei"),
                                    NodeRef(NodeType::ITEM, "jade_sword"), "owns")),
        story_snapshot(), 8);

    EXPECT_TRUE(result.findings.empty());
    EXPECT_EQ(result.staged.find_node(NodeRef(NodeType::CHARACTER, "wei")), nullptr);
    EXPECT_NE(result.staged.find_node(NodeRef(NodeType::ITEM, "jade_sword")), nullptr);
    ASSERT_EQ(result.staged.edges.size(), 1u);
    EXPECT_EQ(result.staged.edges[0].relation, "owns");

    // Edge already in the graph
    CheckResult existing = checker.check("req-1",
        one(CandidateFact::relation(NodeRef(NodeType::EVENT, "meeting_wei_6"),
                                    NodeRef(NodeType::CHARACTER, "wei"), "involves")),
        story_snapshot(), 8);
    EXPECT_TRUE(existing.staged.empty());
}

TEST(ConsistencyCheckerTest, CorrectiveInstructionListsBlockingFindings) {
    std::vector<CandidateFact> facts;
    facts.push_back(CandidateFact::event("action", names("lihang"), 7));
    facts.push_back(CandidateFact::event("action", names("wei"), 4));

    ConsistencyChecker checker;
    CheckResult result = checker.check("req-1", facts, story_snapshot(), 7);
    ASSERT_EQ(result.count(Severity::BLOCKING), 1u);
    ASSERT_EQ(result.count(Severity::WARNING), 1u);

    std::string instruction = result.corrective_instruction();
    EXPECT_NE(instruction.find("character:lihang"), std::string::npos);
    EXPECT_NE(instruction.find("died at seq 5"), std::string::npos);
    EXPECT_EQ(instruction.find("precedes"), std::string::npos);

    Json j = result.to_json();
    EXPECT_EQ(j["findings"].size(), 2u);
    EXPECT_EQ(j["findings"][0]["severity"], "blocking");
}

// ============================================================================
// Fact parsing
// ============================================================================

TEST(CandidateFactTest, ParsesKnownKinds) {
    CandidateFact fact;
    ASSERT_TRUE(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"event\",\"event_kind\":\"death\",\"participants\":[\"lihang\",\" \"],"
        "\"seq\":5,\"flashback\":true}"), fact).ok());
    ASSERT_EQ(fact.kind(), FactKind::EVENT);
    EXPECT_EQ(fact.seq, 5);
    EXPECT_TRUE(fact.flashback);
    const EventFact& event = std::get<EventFact>(fact.payload);
    ASSERT_EQ(event.participants.size(), 1u);
    EXPECT_TRUE(event.is_death());
    EXPECT_EQ(event.deceased(), names("lihang"));

    ASSERT_TRUE(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"relation\",\"source\":\"lihang\",\"target\":\"item:jade_sword\","
        "\"relation\":\"owns\"}"), fact).ok());
    const RelationFact& relation = std::get<RelationFact>(fact.payload);
    EXPECT_EQ(relation.source, NodeRef(NodeType::CHARACTER, "lihang"));
    EXPECT_EQ(relation.target, NodeRef(NodeType::ITEM, "jade_sword"));

    ASSERT_TRUE(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"rule_invocation\",\"rule\":\"magic_cost\",\"value\":\"blood\"}"), fact).ok());
    EXPECT_EQ(std::get<RuleInvocationFact>(fact.payload).attributes["value"], "blood");
}

TEST(CandidateFactTest, RejectsIncompleteFacts) {
    CandidateFact fact;
    EXPECT_EQ(CandidateFact::from_json(Json::parse("[1]"), fact).code, ErrorCode::VALIDATION);
    EXPECT_EQ(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"character_state\",\"attributes\":{\"mood\":\"sad\"}}"), fact).code,
        ErrorCode::VALIDATION);
    EXPECT_EQ(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"location_change\",\"character\":\"wei\"}"), fact).code,
        ErrorCode::VALIDATION);
    EXPECT_EQ(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"relation\",\"source\":\"wei\",\"target\":\"mei\"}"), fact).code,
        ErrorCode::VALIDATION);
}

TEST(CandidateFactTest, RejectsNegativeSeq) {
    CandidateFact fact;
    Status s = CandidateFact::from_json(Json::parse(
        "{\"kind\":\"location_change\",\"character\":\"wei\",\"location\":\"harbor\",\"seq\":-3}"),
        fact);
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);

    ASSERT_TRUE(CandidateFact::from_json(Json::parse(
        "{\"kind\":\"location_change\",\"character\":\"wei\",\"location\":\"harbor\",\"seq\":0}"),
        fact).ok());
    EXPECT_EQ(fact.seq, 0);
}

TEST(CandidateFactTest, ListAcceptsArrayOrFactsObject) {
    std::vector<CandidateFact> facts;
    ASSERT_TRUE(CandidateFact::list_from_json(Json::parse(
        "{\"facts\":[{\"kind\":\"location_change\",\"character\":\"wei\",\"location\":\"harbor\"}]}"),
        facts).ok());
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0].kind(), FactKind::LOCATION_CHANGE);

    Status s = CandidateFact::list_from_json(Json::parse(
        "[{\"kind\":\"weather\"},{\"kind\":\"event\"}]"), facts);
    EXPECT_EQ(s.code, ErrorCode::VALIDATION);
    EXPECT_NE(s.error.find("fact 1"), std::string::npos);

    EXPECT_EQ(CandidateFact::list_from_json(Json::parse("\"none\""), facts).code,
              ErrorCode::VALIDATION);
}
