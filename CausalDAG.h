//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include "set_ops.h"
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

typedef std::pair<std::string, std::string> NamedEdge;

/**
 * A directed acyclic graph over named random variables, where an edge u -> v reads
 * "u causes v".
 *
 * Nodes are stored as dense indices with adjacency kept in both directions. Every
 * mutation that would introduce a cycle throws CycleError and leaves the graph unchanged.
 * Copies are deep: derived graphs never share edge storage with their source.
 */
class CausalDAG {
private:
    std::vector<std::string> node_names;
    std::unordered_map<std::string, int> node_index;
    std::vector<FlatSet> children;
    std::vector<FlatSet> parents;

    int number_of_edges = 0;

    FlatSet get_reachable(const FlatSet &sources, bool follow_children) const;

    bool creates_cycle(int x, int y) const;

    void add_directed_edge(int x, int y);

public:
    CausalDAG() = default;

    /**
     * Read a causal DAG from a DOT file.
     * @throws DotParseError if the file cannot be opened or is not a valid digraph.
     * @throws CycleError if the graph it describes is cyclic.
     */
    static CausalDAG from_dot(const std::string &filename);

    static CausalDAG from_dot_string(const std::string &dot);

    int add_node(const std::string &name);

    void add_edge(const std::string &u, const std::string &v);

    void add_edges(const std::vector<NamedEdge> &edges);

    void remove_edge(const std::string &u, const std::string &v);

    void remove_edges(const std::vector<NamedEdge> &edges);

    void remove_directed_edge(int x, int y);

    bool has_node(const std::string &name) const;

    bool has_edge(const std::string &u, const std::string &v) const;

    bool has_directed_edge(int x, int y) const;

    int get_number_of_nodes() const;

    int get_number_of_edges() const;

    /**
     * Returns the index of a node.
     * @throws UnknownNodeError if the graph has no node with this name.
     */
    int get_node_index(const std::string &name) const;

    const std::string &get_node_name(int node) const;

    const FlatSet &get_parents(int node) const;

    const FlatSet &get_children(int node) const;

    std::vector<std::string> get_nodes() const;

    std::vector<NamedEdge> get_edges() const;

    bool is_acyclic() const;

    FlatSet get_descendants(const FlatSet &nodes) const;

    FlatSet get_ancestors(const FlatSet &nodes) const;

    NodeNames descendants(const std::string &name) const;

    NodeNames ancestors(const std::string &name) const;

    FlatSet to_indices(const NodeNames &names) const;

    NodeNames to_names(const FlatSet &nodes) const;

    CausalDAG copy() const { return *this; }

    CausalDAG get_proper_backdoor_graph(const NodeNames &treatments, const NodeNames &outcomes) const;

    NodeNames get_minimal_adjustment_set(const NodeNames &treatments, const NodeNames &outcomes) const;

    std::string to_string() const;

    bool operator==(const CausalDAG &other) const;

    bool operator!=(const CausalDAG &other) const { return !(*this == other); }

    friend std::ostream &operator<<(std::ostream &os, const CausalDAG &obj);
};
