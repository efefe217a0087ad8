//
// Created by the causal_adjust developers on 10/19/26.
//
#include "CausalDAG.h"
#include "Backdoor.h"
#include "DotReader.h"
#include "Errors.h"
#include "Separator.h"
#include <fstream>
#include <queue>
#include <sstream>

CausalDAG CausalDAG::from_dot(const std::string &filename) {
    std::ifstream file(filename);
    if (!file) { throw DotParseError("Could not open DOT file " + filename); }
    return read_dot(file);
}

CausalDAG CausalDAG::from_dot_string(const std::string &dot) {
    std::istringstream stream(dot);
    return read_dot(stream);
}

int CausalDAG::add_node(const std::string &name) {
    auto it = node_index.find(name);
    if (it != node_index.end()) { return it->second; }
    int node = static_cast<int>(node_names.size());
    node_names.push_back(name);
    children.emplace_back();
    parents.emplace_back();
    node_index.emplace(name, node);
    return node;
}

/**
 * Add the edge u -> v, creating u and v if they are not nodes yet.
 *
 * The cycle check runs before anything is inserted, so a rejected edge leaves
 * both the node set and the edge set untouched.
 *
 * @throws CycleError if u == v or if v is already an ancestor of u.
 */
void CausalDAG::add_edge(const std::string &u, const std::string &v) {
    if (u == v) { throw CycleError("Invalid Causal DAG: self-loop on " + u + "."); }
    if (has_node(u) && has_node(v)) {
        int x = get_node_index(u);
        int y = get_node_index(v);
        if (has_directed_edge(x, y)) { return; }
        if (creates_cycle(x, y)) {
            throw CycleError("Invalid Causal DAG: edge " + u + " -> " + v + " creates a cycle.");
        }
    }
    int x = add_node(u);
    int y = add_node(v);
    add_directed_edge(x, y);
}

void CausalDAG::add_edges(const std::vector<NamedEdge> &edges) {
    // Work on a copy so that a cycle halfway through the list is rejected atomically
    CausalDAG candidate = *this;
    for (const auto &[u, v]: edges) { candidate.add_edge(u, v); }
    *this = std::move(candidate);
}

void CausalDAG::remove_edge(const std::string &u, const std::string &v) {
    if (!has_node(u) || !has_node(v)) { return; }
    int x = get_node_index(u);
    int y = get_node_index(v);
    if (has_directed_edge(x, y)) { remove_directed_edge(x, y); }
}

void CausalDAG::remove_edges(const std::vector<NamedEdge> &edges) {
    for (const auto &[u, v]: edges) { remove_edge(u, v); }
}

// Unchecked: callers guarantee that x -> y keeps the graph acyclic.
void CausalDAG::add_directed_edge(int x, int y) {
    if (!children[x].insert(y).second) { return; }
    parents[y].insert(x);
    number_of_edges++;
}

void CausalDAG::remove_directed_edge(int x, int y) {
    if (children.at(x).erase(y) == 0) { return; }
    parents[y].erase(x);
    number_of_edges--;
}

bool CausalDAG::has_node(const std::string &name) const {
    return node_index.find(name) != node_index.end();
}

bool CausalDAG::has_edge(const std::string &u, const std::string &v) const {
    if (!has_node(u) || !has_node(v)) { return false; }
    return has_directed_edge(get_node_index(u), get_node_index(v));
}

bool CausalDAG::has_directed_edge(int x, int y) const {
    const FlatSet &children_x = children.at(x);
    return children_x.find(y) != children_x.end();
}

int CausalDAG::get_number_of_nodes() const { return static_cast<int>(node_names.size()); }

int CausalDAG::get_number_of_edges() const { return number_of_edges; }

int CausalDAG::get_node_index(const std::string &name) const {
    auto it = node_index.find(name);
    if (it == node_index.end()) { throw UnknownNodeError(name); }
    return it->second;
}

const std::string &CausalDAG::get_node_name(int node) const { return node_names.at(node); }

const FlatSet &CausalDAG::get_parents(int node) const { return parents.at(node); }

const FlatSet &CausalDAG::get_children(int node) const { return children.at(node); }

std::vector<std::string> CausalDAG::get_nodes() const { return node_names; }

std::vector<NamedEdge> CausalDAG::get_edges() const {
    std::vector<NamedEdge> edges;
    edges.reserve(number_of_edges);
    for (int node = 0; node < get_number_of_nodes(); ++node) {
        for (int child: children[node]) { edges.emplace_back(node_names[node], node_names[child]); }
    }
    return edges;
}

/**
 * Check that the graph has no directed cycle, by peeling off nodes without parents
 * (Kahn's algorithm).
 *
 * @return `true` if every node could be removed, `false` otherwise.
 */
bool CausalDAG::is_acyclic() const {
    std::vector<int> in_degree(node_names.size());
    std::queue<int> queue;
    for (int node = 0; node < get_number_of_nodes(); ++node) {
        in_degree[node] = static_cast<int>(parents[node].size());
        if (in_degree[node] == 0) { queue.push(node); }
    }
    int n_removed = 0;
    while (!queue.empty()) {
        int node = queue.front();
        queue.pop();
        n_removed++;
        for (int child: children[node]) {
            if (--in_degree[child] == 0) { queue.push(child); }
        }
    }
    return n_removed == get_number_of_nodes();
}

// x -> y closes a cycle iff x is reachable from y.
bool CausalDAG::creates_cycle(int x, int y) const {
    if (x == y) { return true; }
    FlatSet start{y};
    FlatSet reachable = get_reachable(start, true);
    return reachable.find(x) != reachable.end();
}

/**
 * BFS from all the sources at once, following children (or parents).
 * A source is part of the result only if another source reaches it.
 */
FlatSet CausalDAG::get_reachable(const FlatSet &sources, bool follow_children) const {
    std::vector<char> visited(node_names.size(), 0);
    std::vector<int> reached;
    std::queue<int> queue;
    for (int node: sources) { queue.push(node); }

    while (!queue.empty()) {
        int node = queue.front();
        queue.pop();
        const FlatSet &next = follow_children ? children[node] : parents[node];
        for (int n: next) {
            if (visited[n]) { continue; }
            visited[n] = 1;
            reached.push_back(n);
            queue.push(n);
        }
    }
    return FlatSet(reached.begin(), reached.end());
}

FlatSet CausalDAG::get_descendants(const FlatSet &nodes) const { return get_reachable(nodes, true); }

FlatSet CausalDAG::get_ancestors(const FlatSet &nodes) const { return get_reachable(nodes, false); }

NodeNames CausalDAG::descendants(const std::string &name) const {
    return to_names(get_descendants(FlatSet{get_node_index(name)}));
}

NodeNames CausalDAG::ancestors(const std::string &name) const {
    return to_names(get_ancestors(FlatSet{get_node_index(name)}));
}

FlatSet CausalDAG::to_indices(const NodeNames &names) const {
    FlatSet nodes;
    nodes.reserve(names.size());
    for (auto &name: names) { nodes.insert(get_node_index(name)); }
    return nodes;
}

NodeNames CausalDAG::to_names(const FlatSet &nodes) const {
    NodeNames names;
    for (int node: nodes) { names.insert(node_names.at(node)); }
    return names;
}

CausalDAG CausalDAG::get_proper_backdoor_graph(const NodeNames &treatments,
                                               const NodeNames &outcomes) const {
    return ::get_proper_backdoor_graph(*this, treatments, outcomes);
}

NodeNames CausalDAG::get_minimal_adjustment_set(const NodeNames &treatments,
                                                const NodeNames &outcomes) const {
    return ::get_minimal_adjustment_set(*this, treatments, outcomes);
}

std::string CausalDAG::to_string() const {
    std::string result = "Nodes: [";
    for (auto &name: node_names) { result += name + ", "; }
    if (!node_names.empty()) {
        result.pop_back();
        result.pop_back();
    }
    result += "]\nEdges: [";
    auto edges = get_edges();
    for (auto &[u, v]: edges) { result += "(" + u + ", " + v + "), "; }
    if (!edges.empty()) {
        result.pop_back();
        result.pop_back();
    }
    result += "]";
    return result;
}

// Equality on names, not on indices: two graphs built in a different order compare equal.
bool CausalDAG::operator==(const CausalDAG &other) const {
    if (number_of_edges != other.number_of_edges || node_names.size() != other.node_names.size()) {
        return false;
    }
    for (auto &name: node_names) {
        if (!other.has_node(name)) { return false; }
    }
    for (auto &[u, v]: get_edges()) {
        if (!other.has_edge(u, v)) { return false; }
    }
    return true;
}

std::ostream &operator<<(std::ostream &os, const CausalDAG &obj) {
    os << obj.to_string();
    return os;
}
