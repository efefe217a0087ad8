//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include "CausalDAG.h"
#include <vector>

/**
 * Undirected moral graph of the subgraph induced by the ancestral closure of some nodes.
 *
 * `adjacent` is indexed like the causal graph; nodes outside the closure have no neighbors.
 */
struct MoralGraph {
    FlatSet nodes;// An(S) ∪ S
    std::vector<FlatSet> adjacent;
};

MoralGraph get_moral_ancestral_graph(const CausalDAG &graph, const FlatSet &nodes);

/**
 * Check whether `z` d-separates `x` from `y`, i.e. whether x and y are separated by z in
 * the moral graph of An(x ∪ y ∪ z).
 *
 * @throws std::invalid_argument if x or y is empty, or if the three sets are not disjoint.
 */
bool is_d_separated(const CausalDAG &graph, const NodeNames &x, const NodeNames &y,
                    const NodeNames &z);

bool is_d_separated_nodes(const CausalDAG &graph, const FlatSet &x, const FlatSet &y,
                          const FlatSet &z);

/**
 * Find a minimal set of nodes that d-separates `x` from `y`: no proper subset of the result
 * separates them.
 *
 * Start from Z0 = An(x ∪ y) \ (x ∪ y), which separates x from y whenever any set does.
 * Keep Z1, the nodes of Z0 met by a search from x in the moral ancestral graph that stops
 * on Z0, then Z, the nodes of Z1 met by a search from y that stops on Z1
 * (Tian, Paz and Pearl, "Finding minimal d-separators", 1998).
 *
 * @throws std::invalid_argument if x or y is empty.
 * @throws NoAdjustmentSetError if x and y overlap or no set separates them.
 */
NodeNames minimal_d_separator(const CausalDAG &graph, const NodeNames &x, const NodeNames &y);

FlatSet minimal_d_separator_nodes(const CausalDAG &graph, const FlatSet &x, const FlatSet &y);

/**
 * Smallest set of variables blocking every back-door path between the treatments and the
 * outcomes: the minimal d-separator of both sets in the proper back-door graph.
 *
 * @throws NoAdjustmentSetError for empty or overlapping sets, or when no adjustment exists.
 * @throws UnknownNodeError if a name is not a node of `graph`.
 */
NodeNames get_minimal_adjustment_set(const CausalDAG &graph, const NodeNames &treatments,
                                     const NodeNames &outcomes);
