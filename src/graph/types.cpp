#include <novelforge/graph/types.hpp>

namespace novelforge {

std::string node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::CHARACTER: return "character";
        case NodeType::LOCATION: return "location";
        case NodeType::ITEM: return "item";
        case NodeType::RULE: return "rule";
        case NodeType::EVENT: return "event";
    }
    return "character";
}

bool node_type_from_string(const std::string& name, NodeType& out) {
    if (name == "character") { out = NodeType::CHARACTER; return true; }
    if (name == "location") { out = NodeType::LOCATION; return true; }
    if (name == "item") { out = NodeType::ITEM; return true; }
    if (name == "rule") { out = NodeType::RULE; return true; }
    if (name == "event") { out = NodeType::EVENT; return true; }
    return false;
}

std::string node_ref_string(NodeType type, const std::string& key) {
    return node_type_to_string(type) + ":" + key;
}

bool parse_node_ref(const std::string& ref, NodeType& type, std::string& key) {
    size_t colon = ref.find(':');
    if (colon == std::string::npos || colon + 1 >= ref.size()) return false;
    if (!node_type_from_string(ref.substr(0, colon), type)) return false;
    key = ref.substr(colon + 1);
    return true;
}

// ============================================================================
// Serialization
// ============================================================================

Json KnowledgeNode::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["project_id"] = project_id;
    j["type"] = node_type_to_string(type);
    j["key"] = key;
    j["attributes"] = attributes;
    j["version"] = version;
    j["updated_at"] = updated_at;
    return j;
}

bool KnowledgeNode::from_json(const Json& j, KnowledgeNode& out) {
    if (!j.is_object()) return false;
    if (!j.contains("id") || !j["id"].is_string()) return false;
    if (!node_type_from_string(j.value("type", std::string("")), out.type)) return false;

    out.id = j["id"].get<std::string>();
    out.project_id = j.value("project_id", std::string(""));
    out.key = j.value("key", std::string(""));
    out.attributes = j.contains("attributes") && j["attributes"].is_object()
        ? j["attributes"] : Json::object();
    out.version = j.value("version", 1);
    out.updated_at = j.value("updated_at", static_cast<int64_t>(0));
    return !out.key.empty();
}

Json KnowledgeEdge::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["project_id"] = project_id;
    j["source_id"] = source_id;
    j["target_id"] = target_id;
    j["relation"] = relation;
    j["attributes"] = attributes;
    j["created_at"] = created_at;
    return j;
}

bool KnowledgeEdge::from_json(const Json& j, KnowledgeEdge& out) {
    if (!j.is_object()) return false;
    out.id = j.value("id", std::string(""));
    out.project_id = j.value("project_id", std::string(""));
    out.source_id = j.value("source_id", std::string(""));
    out.target_id = j.value("target_id", std::string(""));
    out.relation = j.value("relation", std::string(""));
    out.attributes = j.contains("attributes") && j["attributes"].is_object()
        ? j["attributes"] : Json::object();
    out.created_at = j.value("created_at", static_cast<int64_t>(0));
    return !out.id.empty() && !out.source_id.empty() && !out.target_id.empty();
}

// ============================================================================
// Subgraph
// ============================================================================

const KnowledgeNode* Subgraph::find_node_by_id(const std::string& id) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].id == id) return &nodes[i];
    }
    return nullptr;
}

std::vector<std::string> Subgraph::render_facts() const {
    std::vector<std::string> lines;

    for (size_t i = 0; i < nodes.size(); ++i) {
        Json visible = Json::object();
        const Json& attrs = nodes[i].attributes;
        for (Json::const_iterator it = attrs.begin(); it != attrs.end(); ++it) {
            if (!it.key().empty() && it.key()[0] == '_') continue;
            visible[it.key()] = it.value();
        }
        lines.push_back(nodes[i].ref() + " " + visible.dump());
    }

    for (size_t i = 0; i < edges.size(); ++i) {
        const KnowledgeNode* src = find_node_by_id(edges[i].source_id);
        const KnowledgeNode* dst = find_node_by_id(edges[i].target_id);
        if (!src || !dst) continue;
        lines.push_back(src->ref() + " -" + edges[i].relation + "-> " + dst->ref());
    }
    return lines;
}

Json Subgraph::to_json() const {
    Json j = Json::object();
    j["nodes"] = Json::array();
    j["edges"] = Json::array();
    for (size_t i = 0; i < nodes.size(); ++i) j["nodes"].push_back(nodes[i].to_json());
    for (size_t i = 0; i < edges.size(); ++i) j["edges"].push_back(edges[i].to_json());
    return j;
}

// ============================================================================
// GraphSnapshot
// ============================================================================

void GraphSnapshot::build_index() {
    by_id_.clear();
    by_ref_.clear();
    by_key_.clear();
    edges_by_node_.clear();

    for (size_t i = 0; i < nodes.size(); ++i) {
        by_id_[nodes[i].id] = i;
        by_ref_[nodes[i].ref()] = i;
        by_key_.insert(std::make_pair(nodes[i].key, i));
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        edges_by_node_.insert(std::make_pair(edges[i].source_id, i));
        if (edges[i].target_id != edges[i].source_id) {
            edges_by_node_.insert(std::make_pair(edges[i].target_id, i));
        }
    }
}

const KnowledgeNode* GraphSnapshot::find_node(NodeType type, const std::string& key) const {
    std::map<std::string, size_t>::const_iterator it = by_ref_.find(node_ref_string(type, key));
    return it == by_ref_.end() ? nullptr : &nodes[it->second];
}

const KnowledgeNode* GraphSnapshot::find_node_by_id(const std::string& node_id) const {
    std::map<std::string, size_t>::const_iterator it = by_id_.find(node_id);
    return it == by_id_.end() ? nullptr : &nodes[it->second];
}

std::vector<const KnowledgeNode*> GraphSnapshot::find_nodes_by_key(const std::string& key) const {
    std::vector<const KnowledgeNode*> result;
    std::pair<std::multimap<std::string, size_t>::const_iterator,
              std::multimap<std::string, size_t>::const_iterator> range = by_key_.equal_range(key);
    for (std::multimap<std::string, size_t>::const_iterator it = range.first; it != range.second; ++it) {
        result.push_back(&nodes[it->second]);
    }
    return result;
}

std::vector<const KnowledgeEdge*> GraphSnapshot::edges_of(const std::string& node_id) const {
    std::vector<const KnowledgeEdge*> result;
    std::pair<std::multimap<std::string, size_t>::const_iterator,
              std::multimap<std::string, size_t>::const_iterator> range = edges_by_node_.equal_range(node_id);
    for (std::multimap<std::string, size_t>::const_iterator it = range.first; it != range.second; ++it) {
        result.push_back(&edges[it->second]);
    }
    return result;
}

std::vector<std::string> GraphSnapshot::resolve_seed(const std::string& seed) const {
    std::vector<std::string> ids;

    NodeType type;
    std::string key;
    if (parse_node_ref(seed, type, key)) {
        const KnowledgeNode* node = find_node(type, key);
        if (node) ids.push_back(node->id);
        return ids;
    }

    std::vector<const KnowledgeNode*> matches = find_nodes_by_key(seed);
    for (size_t i = 0; i < matches.size(); ++i) {
        ids.push_back(matches[i]->id);
    }
    if (ids.empty() && find_node_by_id(seed)) {
        ids.push_back(seed);
    }
    return ids;
}

Subgraph GraphSnapshot::subgraph(const std::vector<std::string>& seeds, int depth) const {
    std::vector<std::string> seed_ids;
    for (size_t i = 0; i < seeds.size(); ++i) {
        std::vector<std::string> resolved = resolve_seed(seeds[i]);
        seed_ids.insert(seed_ids.end(), resolved.begin(), resolved.end());
    }

    std::set<std::string> reached = bfs_collect(seed_ids, depth < 0 ? 0 : depth,
        [this](const std::string& node_id) {
            std::vector<std::string> next;
            std::vector<const KnowledgeEdge*> touching = edges_of(node_id);
            for (size_t i = 0; i < touching.size(); ++i) {
                next.push_back(touching[i]->source_id == node_id
                               ? touching[i]->target_id : touching[i]->source_id);
            }
            return next;
        });

    Subgraph result;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (reached.count(nodes[i].id)) result.nodes.push_back(nodes[i]);
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        if (reached.count(edges[i].source_id) && reached.count(edges[i].target_id)) {
            result.edges.push_back(edges[i]);
        }
    }
    return result;
}

Json GraphSnapshot::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["project_id"] = project_id;
    j["graph_version"] = graph_version;
    j["created_at"] = created_at;
    j["nodes"] = Json::array();
    j["edges"] = Json::array();
    for (size_t i = 0; i < nodes.size(); ++i) j["nodes"].push_back(nodes[i].to_json());
    for (size_t i = 0; i < edges.size(); ++i) j["edges"].push_back(edges[i].to_json());
    return j;
}

bool GraphSnapshot::from_json(const Json& j, GraphSnapshot& out) {
    if (!j.is_object()) return false;
    if (!j.contains("nodes") || !j["nodes"].is_array()) return false;
    if (!j.contains("edges") || !j["edges"].is_array()) return false;

    out.id = j.value("id", std::string(""));
    out.project_id = j.value("project_id", std::string(""));
    out.graph_version = j.value("graph_version", static_cast<int64_t>(0));
    out.created_at = j.value("created_at", static_cast<int64_t>(0));
    out.nodes.clear();
    out.edges.clear();

    for (size_t i = 0; i < j["nodes"].size(); ++i) {
        KnowledgeNode node;
        if (!KnowledgeNode::from_json(j["nodes"][i], node)) return false;
        out.nodes.push_back(node);
    }
    for (size_t i = 0; i < j["edges"].size(); ++i) {
        KnowledgeEdge edge;
        if (!KnowledgeEdge::from_json(j["edges"][i], edge)) return false;
        out.edges.push_back(edge);
    }
    out.build_index();
    return true;
}

} // namespace novelforge
