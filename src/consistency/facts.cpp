#include <novelforge/consistency/facts.hpp>
#include <novelforge/core/utils.hpp>

namespace novelforge {

namespace {

std::string string_field(const Json& j, const char* name) {
    Json::const_iterator it = j.find(name);
    if (it == j.end() || !it->is_string()) return std::string();
    return trim(it->get<std::string>());
}

Json object_field(const Json& j, const char* name) {
    Json::const_iterator it = j.find(name);
    if (it == j.end() || !it->is_object()) return Json::object();
    return *it;
}

struct FactToJson {
    Json& out;

    void operator()(const CharacterStateFact& f) const {
        out["kind"] = "character_state";
        out["character"] = f.character;
        out["attributes"] = f.attributes;
    }
    void operator()(const LocationChangeFact& f) const {
        out["kind"] = "location_change";
        out["character"] = f.character;
        out["location"] = f.location;
    }
    void operator()(const RuleInvocationFact& f) const {
        out["kind"] = "rule_invocation";
        out["rule"] = f.rule;
        out["attributes"] = f.attributes;
    }
    void operator()(const EventFact& f) const {
        out["kind"] = "event";
        if (!f.key.empty()) out["key"] = f.key;
        out["event_kind"] = f.event_kind;
        out["participants"] = f.participants;
        if (!f.subject.empty()) out["subject"] = f.subject;
        if (!f.description.empty()) out["description"] = f.description;
        if (!f.attributes.empty()) out["attributes"] = f.attributes;
    }
    void operator()(const RelationFact& f) const {
        out["kind"] = "relation";
        out["source"] = f.source.to_string();
        out["target"] = f.target.to_string();
        out["relation"] = f.relation;
        if (!f.attributes.empty()) out["attributes"] = f.attributes;
    }
    void operator()(const UnknownFact& f) const {
        out = f.payload.is_object() ? f.payload : Json::object();
        out["kind"] = f.kind;
    }
};

} // namespace

bool NodeRef::parse(const std::string& text, NodeType default_type, NodeRef& out) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return false;

    NodeType type;
    std::string key;
    if (parse_node_ref(trimmed, type, key)) {
        out = NodeRef(type, key);
    } else {
        out = NodeRef(default_type, trimmed);
    }
    return true;
}

std::string fact_kind_to_string(FactKind kind) {
    switch (kind) {
        case FactKind::CHARACTER_STATE: return "character_state";
        case FactKind::LOCATION_CHANGE: return "location_change";
        case FactKind::RULE_INVOCATION: return "rule_invocation";
        case FactKind::EVENT: return "event";
        case FactKind::RELATION: return "relation";
        case FactKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

bool EventFact::is_death() const {
    std::string k = to_lower(event_kind);
    return k == "death" || k == "died" || k == "killed";
}

std::vector<std::string> EventFact::deceased() const {
    if (!is_death()) return std::vector<std::string>();
    if (!subject.empty()) return std::vector<std::string>(1, subject);
    return participants;
}

FactKind CandidateFact::kind() const {
    switch (payload.index()) {
        case 0: return FactKind::CHARACTER_STATE;
        case 1: return FactKind::LOCATION_CHANGE;
        case 2: return FactKind::RULE_INVOCATION;
        case 3: return FactKind::EVENT;
        case 4: return FactKind::RELATION;
        default: return FactKind::UNKNOWN;
    }
}

Status CandidateFact::from_json(const Json& j, CandidateFact& out) {
    if (!j.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "fact must be a JSON object");
    }

    std::string kind = to_lower(string_field(j, "kind"));
    if (kind.empty()) kind = to_lower(string_field(j, "type"));

    out = CandidateFact();
    Json::const_iterator seq = j.find("seq");
    if (seq != j.end() && seq->is_number_integer()) {
        out.seq = seq->get<int64_t>();
        if (out.seq < 0) {
            return Status::fail(ErrorCode::VALIDATION, "fact seq must not be negative");
        }
    }
    Json::const_iterator flashback = j.find("flashback");
    if (flashback != j.end() && flashback->is_boolean()) {
        out.flashback = flashback->get<bool>();
    }

    if (kind == "character_state") {
        CharacterStateFact f;
        f.character = string_field(j, "character");
        f.attributes = object_field(j, "attributes");
        if (f.character.empty() || f.attributes.empty()) {
            return Status::fail(ErrorCode::VALIDATION,
                                "character_state needs 'character' and 'attributes'");
        }
        out.payload = f;
    } else if (kind == "location_change") {
        LocationChangeFact f;
        f.character = string_field(j, "character");
        f.location = string_field(j, "location");
        if (f.character.empty() || f.location.empty()) {
            return Status::fail(ErrorCode::VALIDATION,
                                "location_change needs 'character' and 'location'");
        }
        out.payload = f;
    } else if (kind == "rule_invocation") {
        RuleInvocationFact f;
        f.rule = string_field(j, "rule");
        f.attributes = object_field(j, "attributes");
        Json::const_iterator value = j.find("value");
        if (value != j.end()) f.attributes["value"] = *value;
        if (f.rule.empty() || f.attributes.empty()) {
            return Status::fail(ErrorCode::VALIDATION,
                                "rule_invocation needs 'rule' and a value");
        }
        out.payload = f;
    } else if (kind == "event") {
        EventFact f;
        f.key = string_field(j, "key");
        f.event_kind = string_field(j, "event_kind");
        f.subject = string_field(j, "subject");
        f.description = string_field(j, "description");
        f.attributes = object_field(j, "attributes");
        Json::const_iterator participants = j.find("participants");
        if (participants != j.end() && participants->is_array()) {
            for (size_t i = 0; i < participants->size(); ++i) {
                if ((*participants)[i].is_string()) {
                    std::string name = trim((*participants)[i].get<std::string>());
                    if (!name.empty()) f.participants.push_back(name);
                }
            }
        }
        if (f.event_kind.empty()) {
            return Status::fail(ErrorCode::VALIDATION, "event needs 'event_kind'");
        }
        out.payload = f;
    } else if (kind == "relation") {
        RelationFact f;
        f.relation = string_field(j, "relation");
        f.attributes = object_field(j, "attributes");
        if (!NodeRef::parse(string_field(j, "source"), NodeType::CHARACTER, f.source) ||
            !NodeRef::parse(string_field(j, "target"), NodeType::CHARACTER, f.target) ||
            f.relation.empty()) {
            return Status::fail(ErrorCode::VALIDATION,
                                "relation needs 'source', 'target' and 'relation'");
        }
        out.payload = f;
    } else {
        UnknownFact f;
        f.kind = kind;
        f.payload = j;
        out.payload = f;
    }
    return Status::ok_status();
}

Status CandidateFact::list_from_json(const Json& j, std::vector<CandidateFact>& out) {
    const Json* items = &j;
    if (j.is_object() && j.contains("facts")) {
        items = &j["facts"];
    }
    if (!items->is_array()) {
        return Status::fail(ErrorCode::VALIDATION, "expected a JSON array of facts");
    }

    out.clear();
    for (size_t i = 0; i < items->size(); ++i) {
        CandidateFact fact;
        Status s = from_json((*items)[i], fact);
        if (!s.ok()) {
            return Status::fail(ErrorCode::VALIDATION,
                                "fact " + std::to_string(i) + ": " + s.error);
        }
        out.push_back(fact);
    }
    return Status::ok_status();
}

Json CandidateFact::to_json() const {
    Json j = Json::object();
    std::visit(FactToJson{j}, payload);
    if (seq != 0) j["seq"] = seq;
    if (flashback) j["flashback"] = true;
    return j;
}

CandidateFact CandidateFact::character_state(const std::string& character, const Json& attributes,
                                             int64_t seq)
{
    CharacterStateFact f;
    f.character = character;
    f.attributes = attributes;
    CandidateFact fact;
    fact.payload = f;
    fact.seq = seq;
    return fact;
}

CandidateFact CandidateFact::event(const std::string& event_kind,
                                   const std::vector<std::string>& participants,
                                   int64_t seq, bool flashback)
{
    EventFact f;
    f.event_kind = event_kind;
    f.participants = participants;
    CandidateFact fact;
    fact.payload = f;
    fact.seq = seq;
    fact.flashback = flashback;
    return fact;
}

CandidateFact CandidateFact::rule(const std::string& rule, const Json& value) {
    RuleInvocationFact f;
    f.rule = rule;
    f.attributes["value"] = value;
    CandidateFact fact;
    fact.payload = f;
    return fact;
}

CandidateFact CandidateFact::relation(const NodeRef& source, const NodeRef& target,
                                      const std::string& relation)
{
    RelationFact f;
    f.source = source;
    f.target = target;
    f.relation = relation;
    CandidateFact fact;
    fact.payload = f;
    return fact;
}

// ============================================================================
// StagedChanges
// ============================================================================

void StagedChanges::stage_node(const NodeRef& ref, const Json& patch, int base_version) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].ref == ref) {
            for (Json::const_iterator it = patch.begin(); it != patch.end(); ++it) {
                Json& slot = nodes[i].patch[it.key()];
                if (slot.is_object() && it.value().is_object()) {
                    for (Json::const_iterator sub = it.value().begin(); sub != it.value().end(); ++sub) {
                        slot[sub.key()] = sub.value();
                    }
                } else {
                    slot = it.value();
                }
            }
            return;
        }
    }
    StagedNode node;
    node.ref = ref;
    node.patch = patch.is_object() ? patch : Json::object();
    node.base_version = base_version;
    nodes.push_back(node);
}

void StagedChanges::stage_edge(const NodeRef& source, const NodeRef& target,
                               const std::string& relation, const Json& attributes)
{
    for (size_t i = 0; i < edges.size(); ++i) {
        if (edges[i].source == source && edges[i].target == target &&
            edges[i].relation == relation) {
            return;
        }
    }
    StagedEdge edge;
    edge.source = source;
    edge.target = target;
    edge.relation = relation;
    edge.attributes = attributes;
    edges.push_back(edge);
}

const StagedNode* StagedChanges::find_node(const NodeRef& ref) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].ref == ref) return &nodes[i];
    }
    return nullptr;
}

Json StagedChanges::to_json() const {
    Json j = Json::object();
    j["nodes"] = Json::array();
    j["edges"] = Json::array();
    for (size_t i = 0; i < nodes.size(); ++i) {
        Json n = Json::object();
        n["ref"] = nodes[i].ref.to_string();
        n["patch"] = nodes[i].patch;
        n["base_version"] = nodes[i].base_version;
        j["nodes"].push_back(n);
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        Json e = Json::object();
        e["source"] = edges[i].source.to_string();
        e["target"] = edges[i].target.to_string();
        e["relation"] = edges[i].relation;
        j["edges"].push_back(e);
    }
    return j;
}

} // namespace novelforge
