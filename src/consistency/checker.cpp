#include <novelforge/consistency/checker.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>

#include <cctype>
#include <sstream>

namespace novelforge {

namespace {

const char* kEstablished = "_established";
const char* kInvolves = "involves";

int64_t json_int(const Json& j, const char* key, int64_t fallback) {
    if (!j.is_object()) return fallback;
    Json::const_iterator it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return it->get<int64_t>();
}

bool json_flag(const Json& j, const char* key) {
    if (!j.is_object()) return false;
    Json::const_iterator it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

std::string json_text(const Json& j, const char* key) {
    if (!j.is_object()) return std::string();
    Json::const_iterator it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

bool is_death_kind(const std::string& kind) {
    std::string k = to_lower(kind);
    return k == "death" || k == "died" || k == "killed";
}

// Lowercase ASCII alphanumerics, other ASCII becomes '_', UTF-8 kept
std::string sanitize_key(const std::string& text) {
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c >= 0x80) {
            out += static_cast<char>(c);
        } else if (std::isalnum(c)) {
            out += static_cast<char>(std::tolower(c));
        } else if (!out.empty() && out[out.size() - 1] != '_') {
            out += '_';
        }
    }
    while (!out.empty() && out[out.size() - 1] == '_') out.erase(out.size() - 1);
    return out;
}

std::string compact(const Json& value) {
    return value.dump();
}

// ============================================================================
// One check pass over a batch of facts
// ============================================================================

struct NodeView {
    bool exists;
    Json attributes;
    int version;            // Snapshot version, 0 when only staged or absent

    NodeView() : exists(false), attributes(Json::object()), version(0) {}
};

struct DeathRecord {
    int64_t seq;
    std::string ref;        // Death event node id, or "event:key" when staged

    DeathRecord() : seq(0) {}
};

class CheckPass {
public:
    CheckPass(const std::string& content_ref, const GraphSnapshot& snapshot, int64_t seq)
        : content_ref_(content_ref)
        , snapshot_(snapshot)
        , request_seq_(seq)
    {
        index_events();
    }

    void run(const std::vector<CandidateFact>& facts) {
        for (size_t i = 0; i < facts.size(); ++i) {
            const CandidateFact& fact = facts[i];
            int64_t seq = fact.seq != 0 ? fact.seq : request_seq_;

            switch (fact.kind()) {
                case FactKind::CHARACTER_STATE:
                    on_character_state(std::get<CharacterStateFact>(fact.payload), seq, fact.flashback);
                    break;
                case FactKind::LOCATION_CHANGE:
                    on_location_change(std::get<LocationChangeFact>(fact.payload), seq, fact.flashback);
                    break;
                case FactKind::RULE_INVOCATION:
                    on_rule(std::get<RuleInvocationFact>(fact.payload));
                    break;
                case FactKind::EVENT:
                    on_event(std::get<EventFact>(fact.payload), seq, fact.flashback);
                    break;
                case FactKind::RELATION:
                    on_relation(std::get<RelationFact>(fact.payload));
                    break;
                case FactKind::UNKNOWN:
                    on_unknown(std::get<UnknownFact>(fact.payload));
                    break;
            }
        }
    }

    CheckResult& result() { return result_; }

private:
    std::string content_ref_;
    const GraphSnapshot& snapshot_;
    int64_t request_seq_;
    CheckResult result_;

    std::map<std::string, DeathRecord> deaths_;         // character key -> earliest death
    std::map<std::string, int64_t> latest_event_seq_;   // character key -> latest event seq

    // ------------------------------------------------------------------------

    void index_events() {
        for (size_t i = 0; i < snapshot_.nodes.size(); ++i) {
            const KnowledgeNode& node = snapshot_.nodes[i];
            if (node.type != NodeType::EVENT) continue;
            if (json_flag(node.attributes, "flashback")) continue;

            int64_t seq = json_int(node.attributes, "seq", 0);
            std::vector<std::string> participants = involved_characters(node);
            for (size_t p = 0; p < participants.size(); ++p) {
                note_event(participants[p], seq);
            }

            if (!is_death_kind(json_text(node.attributes, "event_kind"))) continue;
            std::string subject = json_text(node.attributes, "subject");
            if (!subject.empty()) {
                note_death(subject, seq, node.id);
            } else {
                for (size_t p = 0; p < participants.size(); ++p) {
                    note_death(participants[p], seq, node.id);
                }
            }
        }

        // Characters marked dead without a recorded death event
        for (size_t i = 0; i < snapshot_.nodes.size(); ++i) {
            const KnowledgeNode& node = snapshot_.nodes[i];
            if (node.type != NodeType::CHARACTER) continue;
            if (json_text(node.attributes, "status") != "dead") continue;
            if (deaths_.count(node.key)) continue;

            Json established = node.attributes.value(kEstablished, Json::object());
            note_death(node.key, json_int(established, "status", 0), node.id);
        }
    }

    std::vector<std::string> involved_characters(const KnowledgeNode& event) const {
        std::vector<std::string> keys;
        std::vector<const KnowledgeEdge*> edges = snapshot_.edges_of(event.id);
        for (size_t i = 0; i < edges.size(); ++i) {
            if (edges[i]->source_id != event.id || edges[i]->relation != kInvolves) continue;
            const KnowledgeNode* target = snapshot_.find_node_by_id(edges[i]->target_id);
            if (target && target->type == NodeType::CHARACTER) keys.push_back(target->key);
        }
        return keys;
    }

    void note_event(const std::string& character, int64_t seq) {
        std::map<std::string, int64_t>::iterator it = latest_event_seq_.find(character);
        if (it == latest_event_seq_.end() || seq > it->second) {
            latest_event_seq_[character] = seq;
        }
    }

    void note_death(const std::string& character, int64_t seq, const std::string& ref) {
        std::map<std::string, DeathRecord>::iterator it = deaths_.find(character);
        if (it != deaths_.end() && it->second.seq <= seq) return;
        DeathRecord record;
        record.seq = seq;
        record.ref = ref;
        deaths_[character] = record;
    }

    // Snapshot node with this batch's staged patches applied
    NodeView view_of(const NodeRef& ref) const {
        NodeView view;
        const KnowledgeNode* node = snapshot_.find_node(ref.type, ref.key);
        if (node) {
            view.exists = true;
            view.attributes = node->attributes;
            view.version = node->version;
        }
        const StagedNode* staged = result_.staged.find_node(ref);
        if (staged) {
            view.exists = true;
            view.attributes.merge_patch(staged->patch);
        }
        return view;
    }

    void stage_if_absent(const NodeRef& ref) {
        NodeView view = view_of(ref);
        if (!view.exists) result_.staged.stage_node(ref, Json::object(), 0);
    }

    bool has_edge(const NodeRef& source, const NodeRef& target, const std::string& relation) const {
        const KnowledgeNode* src = snapshot_.find_node(source.type, source.key);
        const KnowledgeNode* dst = snapshot_.find_node(target.type, target.key);
        if (!src || !dst) return false;

        std::vector<const KnowledgeEdge*> edges = snapshot_.edges_of(src->id);
        for (size_t i = 0; i < edges.size(); ++i) {
            if (edges[i]->source_id == src->id && edges[i]->target_id == dst->id &&
                edges[i]->relation == relation) {
                return true;
            }
        }
        return false;
    }

    void add_finding(FindingKind kind, Severity severity, const std::string& description,
                     const std::vector<std::string>& conflicting = std::vector<std::string>())
    {
        ConsistencyFinding finding;
        finding.content_ref = content_ref_;
        finding.kind = kind;
        finding.severity = severity;
        finding.description = description;
        finding.conflicting_refs = conflicting;
        result_.findings.push_back(finding);
    }

    // False (with a blocking finding) when the character died before seq
    bool check_alive(const std::string& character, int64_t seq, bool flashback,
                     const std::string& activity)
    {
        if (flashback) return true;
        std::map<std::string, DeathRecord>::const_iterator it = deaths_.find(character);
        if (it == deaths_.end() || seq <= it->second.seq) return true;

        std::ostringstream desc;
        desc << node_ref_string(NodeType::CHARACTER, character) << " " << activity
             << " at seq " << seq << " but died at seq " << it->second.seq
             << " and the text is not marked as a flashback";
        add_finding(FindingKind::DEAD_CHARACTER_ACTIVE, Severity::BLOCKING, desc.str(),
                    std::vector<std::string>(1, it->second.ref));
        return false;
    }

    // ------------------------------------------------------------------------

    void apply_character_attributes(const std::string& character, const Json& attributes,
                                    int64_t seq, bool flashback)
    {
        NodeRef ref(NodeType::CHARACTER, character);
        NodeView view = view_of(ref);

        if (!view.exists) {
            Json patch = attributes;
            Json established = Json::object();
            for (Json::const_iterator it = attributes.begin(); it != attributes.end(); ++it) {
                established[it.key()] = seq;
            }
            patch[kEstablished] = established;
            result_.staged.stage_node(ref, patch, 0);
            return;
        }

        Json established = view.attributes.value(kEstablished, Json::object());
        for (Json::const_iterator it = attributes.begin(); it != attributes.end(); ++it) {
            const std::string& attr = it.key();
            if (!attr.empty() && attr[0] == '_') continue;

            Json stamp = Json::object();
            stamp[attr] = seq;
            Json patch = Json::object();
            patch[attr] = it.value();
            patch[kEstablished] = stamp;

            Json::const_iterator current = view.attributes.find(attr);
            if (current == view.attributes.end()) {
                add_finding(FindingKind::REFINEMENT, Severity::INFO,
                            ref.to_string() + " gains " + attr + " = " + compact(it.value()));
                result_.staged.stage_node(ref, patch, view.version);
                continue;
            }
            if (*current == it.value()) continue;

            if (flashback) {
                add_finding(FindingKind::STATE_TRANSITION, Severity::INFO,
                            ref.to_string() + " shows " + attr + " = " + compact(it.value()) +
                            " in a flashback; current value kept");
                continue;
            }

            int64_t since = json_int(established, attr.c_str(), 0);
            std::ostringstream desc;
            if (seq <= since) {
                desc << ref.to_string() << " " << attr << " is " << compact(*current)
                     << " since seq " << since << ", contradicted by "
                     << compact(it.value()) << " at seq " << seq;
                add_finding(FindingKind::CONTRADICTION, Severity::BLOCKING, desc.str(),
                            std::vector<std::string>(1, ref.to_string()));
                continue;
            }

            desc << ref.to_string() << " " << attr << " changes from " << compact(*current)
                 << " to " << compact(it.value()) << " at seq " << seq;
            add_finding(FindingKind::STATE_TRANSITION, Severity::INFO, desc.str());
            result_.staged.stage_node(ref, patch, view.version);
        }
    }

    void on_character_state(const CharacterStateFact& fact, int64_t seq, bool flashback) {
        bool restates_death = fact.attributes.size() == 1 &&
                              json_text(fact.attributes, "status") == "dead";
        if (!restates_death && !check_alive(fact.character, seq, flashback, "changes state")) {
            return;
        }
        apply_character_attributes(fact.character, fact.attributes, seq, flashback);
    }

    void on_location_change(const LocationChangeFact& fact, int64_t seq, bool flashback) {
        if (!check_alive(fact.character, seq, flashback, "moves to " + fact.location)) return;

        stage_if_absent(NodeRef(NodeType::LOCATION, fact.location));
        Json attributes = Json::object();
        attributes["location"] = fact.location;
        apply_character_attributes(fact.character, attributes, seq, flashback);
    }

    void on_rule(const RuleInvocationFact& fact) {
        NodeRef ref(NodeType::RULE, fact.rule);
        NodeView view = view_of(ref);
        if (!view.exists) {
            result_.staged.stage_node(ref, fact.attributes, 0);
            return;
        }

        for (Json::const_iterator it = fact.attributes.begin(); it != fact.attributes.end(); ++it) {
            Json::const_iterator current = view.attributes.find(it.key());
            if (current == view.attributes.end()) {
                Json patch = Json::object();
                patch[it.key()] = it.value();
                add_finding(FindingKind::REFINEMENT, Severity::INFO,
                            ref.to_string() + " gains " + it.key() + " = " + compact(it.value()));
                result_.staged.stage_node(ref, patch, view.version);
                continue;
            }
            if (*current == it.value()) continue;

            add_finding(FindingKind::RULE_VIOLATION, Severity::BLOCKING,
                        ref.to_string() + " establishes " + it.key() + " = " + compact(*current) +
                        ", restated as " + compact(it.value()),
                        std::vector<std::string>(1, ref.to_string()));
        }
    }

    void on_event(const EventFact& fact, int64_t seq, bool flashback) {
        std::string key = fact.key;
        if (key.empty()) {
            std::ostringstream derived;
            derived << fact.event_kind;
            for (size_t i = 0; i < fact.participants.size(); ++i) {
                derived << "_" << fact.participants[i];
            }
            derived << "_" << seq;
            key = derived.str();
        }
        key = sanitize_key(key);
        if (key.empty()) {
            add_finding(FindingKind::UNKNOWN_FACT, Severity::WARNING,
                        "event without a usable key ignored");
            return;
        }
        NodeRef event_ref(NodeType::EVENT, key);

        std::vector<std::string> deceased = fact.deceased();
        bool blocked = false;
        for (size_t i = 0; i < fact.participants.size(); ++i) {
            const std::string& who = fact.participants[i];
            if (!check_alive(who, seq, flashback, "takes part in " + event_ref.to_string())) {
                blocked = true;
            }
        }
        if (blocked) return;

        if (!flashback) {
            for (size_t i = 0; i < fact.participants.size(); ++i) {
                const std::string& who = fact.participants[i];
                std::map<std::string, int64_t>::const_iterator latest = latest_event_seq_.find(who);
                if (latest != latest_event_seq_.end() && seq < latest->second) {
                    std::ostringstream desc;
                    desc << event_ref.to_string() << " at seq " << seq << " precedes the latest event of "
                         << node_ref_string(NodeType::CHARACTER, who) << " at seq " << latest->second
                         << " without a flashback tag";
                    add_finding(FindingKind::TIMELINE_REGRESSION, Severity::WARNING, desc.str(),
                                std::vector<std::string>(1, node_ref_string(NodeType::CHARACTER, who)));
                }
            }
        }

        Json patch = fact.attributes.is_object() ? fact.attributes : Json::object();
        patch["event_kind"] = fact.event_kind;
        patch["seq"] = seq;
        patch["flashback"] = flashback;
        if (!fact.subject.empty()) patch["subject"] = fact.subject;
        if (!fact.description.empty()) patch["description"] = fact.description;
        result_.staged.stage_node(event_ref, patch, view_of(event_ref).version);

        for (size_t i = 0; i < fact.participants.size(); ++i) {
            NodeRef who(NodeType::CHARACTER, fact.participants[i]);
            stage_if_absent(who);
            result_.staged.stage_edge(event_ref, who, kInvolves);
            if (!flashback) note_event(fact.participants[i], seq);
        }

        if (flashback || deceased.empty()) return;

        for (size_t i = 0; i < deceased.size(); ++i) {
            NodeRef who(NodeType::CHARACTER, deceased[i]);
            NodeView view = view_of(who);
            Json death = Json::object();
            death["status"] = "dead";
            Json stamp = Json::object();
            stamp["status"] = seq;
            death[kEstablished] = stamp;
            result_.staged.stage_node(who, death, view.version);
            note_death(deceased[i], seq, event_ref.to_string());
        }
    }

    void on_relation(const RelationFact& fact) {
        stage_if_absent(fact.source);
        stage_if_absent(fact.target);
        if (has_edge(fact.source, fact.target, fact.relation)) return;
        result_.staged.stage_edge(fact.source, fact.target, fact.relation, fact.attributes);
    }

    void on_unknown(const UnknownFact& fact) {
        add_finding(FindingKind::UNKNOWN_FACT, Severity::WARNING,
                    "unsupported fact kind '" + fact.kind + "' rejected");
    }
};

} // namespace

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::INFO: return "info";
        case Severity::WARNING: return "warning";
        case Severity::BLOCKING: return "blocking";
    }
    return "info";
}

std::string finding_kind_to_string(FindingKind kind) {
    switch (kind) {
        case FindingKind::CONTRADICTION: return "contradiction";
        case FindingKind::DEAD_CHARACTER_ACTIVE: return "dead_character_active";
        case FindingKind::RULE_VIOLATION: return "rule_violation";
        case FindingKind::TIMELINE_REGRESSION: return "timeline_regression";
        case FindingKind::REFINEMENT: return "refinement";
        case FindingKind::STATE_TRANSITION: return "state_transition";
        case FindingKind::UNKNOWN_FACT: return "unknown_fact";
    }
    return "unknown_fact";
}

Json ConsistencyFinding::to_json() const {
    Json j = Json::object();
    j["content_ref"] = content_ref;
    j["kind"] = finding_kind_to_string(kind);
    j["severity"] = severity_to_string(severity);
    j["description"] = description;
    j["conflicting_refs"] = conflicting_refs;
    return j;
}

bool CheckResult::has_blocking() const {
    return count(Severity::BLOCKING) > 0;
}

size_t CheckResult::count(Severity severity) const {
    size_t n = 0;
    for (size_t i = 0; i < findings.size(); ++i) {
        if (findings[i].severity == severity) ++n;
    }
    return n;
}

std::string CheckResult::corrective_instruction() const {
    std::ostringstream out;
    out << "The previous draft contradicted established story facts. "
        << "Rewrite it so that none of the following happen:";
    for (size_t i = 0; i < findings.size(); ++i) {
        if (findings[i].severity != Severity::BLOCKING) continue;
        out << "\n- " << findings[i].description;
    }
    return out.str();
}

Json CheckResult::to_json() const {
    Json j = Json::object();
    j["findings"] = Json::array();
    for (size_t i = 0; i < findings.size(); ++i) {
        j["findings"].push_back(findings[i].to_json());
    }
    j["staged"] = staged.to_json();
    return j;
}

CheckResult ConsistencyChecker::check(const std::string& content_ref,
                                      const std::vector<CandidateFact>& facts,
                                      const GraphSnapshot& snapshot,
                                      int64_t seq) const
{
    CheckPass pass(content_ref, snapshot, seq);
    pass.run(facts);

    CheckResult& result = pass.result();
    LOG_DEBUG("[Consistency] %s: %zu fact(s), %zu blocking, %zu warning, %zu info, %zu node(s) staged",
              content_ref.c_str(), facts.size(),
              result.count(Severity::BLOCKING), result.count(Severity::WARNING),
              result.count(Severity::INFO), result.staged.nodes.size());
    return result;
}

} // namespace novelforge
