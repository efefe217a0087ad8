//
// Created by the causal_adjust developers on 10/19/26.
//
#include "Backdoor.h"
#include "Errors.h"
#include "utils.h"
#include <stdexcept>

namespace {
    void remove_edges_from(CausalDAG &graph, const FlatSet &sources, const FlatSet &targets) {
        for (int x: sources) {
            // copy: removing edges invalidates the children range
            FlatSet children = graph.get_children(x);
            for (int y: children) {
                if (targets.find(y) != targets.end()) { graph.remove_directed_edge(x, y); }
            }
        }
    }
}// namespace

CausalDAG get_backdoor_graph(const CausalDAG &graph, const NodeNames &treatments) {
    FlatSet treatment_nodes = graph.to_indices(treatments);
    CausalDAG backdoor_graph = graph.copy();
    for (int x: treatment_nodes) {
        while (!backdoor_graph.get_children(x).empty()) {
            backdoor_graph.remove_directed_edge(x, *backdoor_graph.get_children(x).begin());
        }
    }
    return backdoor_graph;
}

FlatSet proper_causal_pathway_nodes(const CausalDAG &graph, const FlatSet &treatments,
                                    const FlatSet &outcomes) {
    if (treatments.empty() || outcomes.empty()) {
        throw std::invalid_argument("Proper causal pathway needs at least one treatment and one outcome.");
    }
    FlatSet pathway = graph.get_descendants(treatments);
    difference_in_place(pathway, treatments);
    if (pathway.empty()) { return pathway; }

    CausalDAG backdoor_graph = get_backdoor_graph(graph, graph.to_names(treatments));
    intersect_in_place(pathway, backdoor_graph.get_ancestors(outcomes));
    return pathway;
}

NodeNames proper_causal_pathway(const CausalDAG &graph, const NodeNames &treatments,
                                const NodeNames &outcomes) {
    FlatSet treatment_nodes = graph.to_indices(treatments);
    FlatSet outcome_nodes = graph.to_indices(outcomes);
    return graph.to_names(proper_causal_pathway_nodes(graph, treatment_nodes, outcome_nodes));
}

CausalDAG get_proper_backdoor_graph(const CausalDAG &graph, const NodeNames &treatments,
                                    const NodeNames &outcomes) {
    for (auto &name: treatments) {
        if (!graph.has_node(name)) { throw UnknownNodeError(name); }
    }
    for (auto &name: outcomes) {
        if (!graph.has_node(name)) { throw UnknownNodeError(name); }
    }
    auto start_time = high_resolution_clock::now();
    auto logger = get_logger();

    CausalDAG proper_backdoor_graph = graph.copy();
    FlatSet treatment_nodes = proper_backdoor_graph.to_indices(treatments);
    FlatSet outcome_nodes = proper_backdoor_graph.to_indices(outcomes);
    FlatSet pathway = proper_causal_pathway_nodes(proper_backdoor_graph, treatment_nodes, outcome_nodes);
    logger->debug("Proper causal pathway: {}", join_names(proper_backdoor_graph.to_names(pathway)));

    // a direct edge t -> o is a proper causal path on its own, its first edge is the edge itself
    FlatSet first_hop_targets = pathway;
    for (int y: outcome_nodes) {
        if (treatment_nodes.find(y) == treatment_nodes.end()) { first_hop_targets.insert(y); }
    }
    int n_edges_before = proper_backdoor_graph.get_number_of_edges();
    remove_edges_from(proper_backdoor_graph, treatment_nodes, first_hop_targets);
    logger->debug("Proper backdoor graph: removed {} edges in {}s",
                  n_edges_before - proper_backdoor_graph.get_number_of_edges(),
                  measure_time(start_time));
    logger->trace("{}", proper_backdoor_graph.to_string());
    return proper_backdoor_graph;
}
