/*
 * NovelForge C++ - Knowledge Graph Types
 *
 * Typed entities (character, location, item, rule, event) and labelled
 * relations between them. Nodes are addressed either by id or by the
 * "type:key" reference string, e.g. "character:lihang".
 *
 * A GraphSnapshot is a full immutable copy of one project's graph, indexed
 * for lookups and bounded breadth-first traversal.
 */
#ifndef novelforge_GRAPH_TYPES_HPP
#define novelforge_GRAPH_TYPES_HPP

#include <novelforge/core/json.hpp>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace novelforge {

enum class NodeType {
    CHARACTER,
    LOCATION,
    ITEM,
    RULE,
    EVENT
};

std::string node_type_to_string(NodeType type);
bool node_type_from_string(const std::string& name, NodeType& out);

// "character:lihang"
std::string node_ref_string(NodeType type, const std::string& key);

// Split "type:key". Returns false when there is no known type prefix.
bool parse_node_ref(const std::string& ref, NodeType& type, std::string& key);

struct KnowledgeNode {
    std::string id;
    std::string project_id;
    NodeType type;
    std::string key;
    Json attributes;        // Always a JSON object
    int version;
    int64_t updated_at;

    KnowledgeNode()
        : type(NodeType::CHARACTER)
        , attributes(Json::object())
        , version(0)
        , updated_at(0) {}

    std::string ref() const { return node_ref_string(type, key); }
    Json to_json() const;
    static bool from_json(const Json& j, KnowledgeNode& out);
};

struct KnowledgeEdge {
    std::string id;
    std::string project_id;
    std::string source_id;
    std::string target_id;
    std::string relation;
    Json attributes;
    int64_t created_at;

    KnowledgeEdge() : attributes(Json::object()), created_at(0) {}

    Json to_json() const;
    static bool from_json(const Json& j, KnowledgeEdge& out);
};

// Induced subgraph returned by traversals
struct Subgraph {
    std::vector<KnowledgeNode> nodes;
    std::vector<KnowledgeEdge> edges;

    bool empty() const { return nodes.empty(); }
    const KnowledgeNode* find_node_by_id(const std::string& id) const;

    // One line per node and per edge, e.g.
    //   character:lihang {"status":"dead"}
    //   event:duel -involves-> character:lihang
    // Attributes whose name starts with '_' are bookkeeping and omitted.
    std::vector<std::string> render_facts() const;

    Json to_json() const;
};

// Breadth-first walk from the seed ids, following neighbors() up to depth
// hops. Every id is visited at most once, so cycles terminate.
template <typename NeighborFn>
std::set<std::string> bfs_collect(const std::vector<std::string>& seeds,
                                  int depth,
                                  NeighborFn neighbors)
{
    std::set<std::string> visited;
    std::deque<std::pair<std::string, int> > frontier;

    for (size_t i = 0; i < seeds.size(); ++i) {
        if (visited.insert(seeds[i]).second) {
            frontier.push_back(std::make_pair(seeds[i], 0));
        }
    }

    while (!frontier.empty()) {
        std::pair<std::string, int> current = frontier.front();
        frontier.pop_front();
        if (current.second >= depth) continue;

        std::vector<std::string> next = neighbors(current.first);
        for (size_t i = 0; i < next.size(); ++i) {
            if (visited.insert(next[i]).second) {
                frontier.push_back(std::make_pair(next[i], current.second + 1));
            }
        }
    }
    return visited;
}

class GraphSnapshot {
public:
    std::string id;             // Empty for unpersisted request snapshots
    std::string project_id;
    int64_t graph_version;
    int64_t created_at;
    std::vector<KnowledgeNode> nodes;
    std::vector<KnowledgeEdge> edges;

    GraphSnapshot() : graph_version(0), created_at(0) {}

    // Must be called after nodes/edges change
    void build_index();

    const KnowledgeNode* find_node(NodeType type, const std::string& key) const;
    const KnowledgeNode* find_node_by_id(const std::string& node_id) const;

    // Nodes of any type with this key
    std::vector<const KnowledgeNode*> find_nodes_by_key(const std::string& key) const;

    // Edges where the node is source or target
    std::vector<const KnowledgeEdge*> edges_of(const std::string& node_id) const;

    // Seed is "type:key", a bare key or a node id
    std::vector<std::string> resolve_seed(const std::string& seed) const;

    Subgraph subgraph(const std::vector<std::string>& seeds, int depth) const;

    Json to_json() const;
    static bool from_json(const Json& j, GraphSnapshot& out);

private:
    std::map<std::string, size_t> by_id_;
    std::map<std::string, size_t> by_ref_;
    std::multimap<std::string, size_t> by_key_;
    std::multimap<std::string, size_t> edges_by_node_;
};

} // namespace novelforge

#endif // novelforge_GRAPH_TYPES_HPP
