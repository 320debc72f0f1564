/*
 * NovelForge C++ - Candidate Facts
 *
 * Structured facts extracted from generated prose, and the graph writes
 * they turn into once accepted.
 *
 * Wire form (one JSON object per fact):
 *   {"kind": "character_state", "character": "lihang",
 *    "attributes": {"mood": "angry"}, "seq": 3}
 *   {"kind": "location_change", "character": "lihang", "location": "harbor"}
 *   {"kind": "rule_invocation", "rule": "magic_cost", "value": "blood"}
 *   {"kind": "event", "event_kind": "death", "participants": ["lihang"],
 *    "seq": 1, "flashback": false}
 *   {"kind": "relation", "source": "character:lihang",
 *    "target": "item:jade_sword", "relation": "owns"}
 * Any other kind is kept as an UnknownFact.
 */
#ifndef novelforge_CONSISTENCY_FACTS_HPP
#define novelforge_CONSISTENCY_FACTS_HPP

#include <novelforge/core/json.hpp>
#include <novelforge/core/status.hpp>
#include <novelforge/graph/types.hpp>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace novelforge {

struct NodeRef {
    NodeType type;
    std::string key;

    NodeRef() : type(NodeType::CHARACTER) {}
    NodeRef(NodeType t, const std::string& k) : type(t), key(k) {}

    std::string to_string() const { return node_ref_string(type, key); }

    // "type:key", or a bare key taken to be of default_type
    static bool parse(const std::string& text, NodeType default_type, NodeRef& out);

    bool operator==(const NodeRef& other) const {
        return type == other.type && key == other.key;
    }
    bool operator<(const NodeRef& other) const {
        return type != other.type ? type < other.type : key < other.key;
    }
};

enum class FactKind {
    CHARACTER_STATE,
    LOCATION_CHANGE,
    RULE_INVOCATION,
    EVENT,
    RELATION,
    UNKNOWN
};

std::string fact_kind_to_string(FactKind kind);

struct CharacterStateFact {
    std::string character;
    Json attributes;

    CharacterStateFact() : attributes(Json::object()) {}
};

struct LocationChangeFact {
    std::string character;
    std::string location;
};

struct RuleInvocationFact {
    std::string rule;
    Json attributes;        // {"value": ...} when given a bare value

    RuleInvocationFact() : attributes(Json::object()) {}
};

struct EventFact {
    std::string key;                        // Derived when absent
    std::string event_kind;                 // "death", "action", "meeting", ...
    std::vector<std::string> participants;  // Character keys
    std::string subject;                    // Who a death applies to (default: all participants)
    std::string description;
    Json attributes;

    EventFact() : attributes(Json::object()) {}

    bool is_death() const;
    std::vector<std::string> deceased() const;
};

struct RelationFact {
    NodeRef source;
    NodeRef target;
    std::string relation;
    Json attributes;

    RelationFact() : attributes(Json::object()) {}
};

struct UnknownFact {
    std::string kind;
    Json payload;
};

typedef std::variant<CharacterStateFact,
                     LocationChangeFact,
                     RuleInvocationFact,
                     EventFact,
                     RelationFact,
                     UnknownFact> FactPayload;

struct CandidateFact {
    FactPayload payload;
    int64_t seq;            // 0 = use the request's sequence number
    bool flashback;

    CandidateFact() : payload(UnknownFact()), seq(0), flashback(false) {}

    FactKind kind() const;

    // VALIDATION when a known kind is missing required fields
    static Status from_json(const Json& j, CandidateFact& out);
    static Status list_from_json(const Json& j, std::vector<CandidateFact>& out);
    Json to_json() const;

    static CandidateFact character_state(const std::string& character, const Json& attributes,
                                         int64_t seq = 0);
    static CandidateFact event(const std::string& event_kind,
                               const std::vector<std::string>& participants,
                               int64_t seq, bool flashback = false);
    static CandidateFact rule(const std::string& rule, const Json& value);
    static CandidateFact relation(const NodeRef& source, const NodeRef& target,
                                  const std::string& relation);
};

// ============================================================================
// Staged graph writes
// ============================================================================

struct StagedNode {
    NodeRef ref;
    Json patch;             // Attributes merged into the node on commit
    int base_version;       // Node version seen at check time, 0 = new node

    StagedNode() : patch(Json::object()), base_version(0) {}
};

struct StagedEdge {
    NodeRef source;
    NodeRef target;
    std::string relation;
    Json attributes;

    StagedEdge() : attributes(Json::object()) {}
};

struct StagedChanges {
    std::vector<StagedNode> nodes;
    std::vector<StagedEdge> edges;

    bool empty() const { return nodes.empty() && edges.empty(); }

    // Merge into an existing staged write for the same node, or append
    void stage_node(const NodeRef& ref, const Json& patch, int base_version);
    void stage_edge(const NodeRef& source, const NodeRef& target,
                    const std::string& relation, const Json& attributes = Json::object());

    const StagedNode* find_node(const NodeRef& ref) const;

    Json to_json() const;
};

} // namespace novelforge

#endif // novelforge_CONSISTENCY_FACTS_HPP
