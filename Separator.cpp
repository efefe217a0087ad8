//
// Created by the causal_adjust developers on 10/19/26.
//
#include "Separator.h"
#include "Backdoor.h"
#include "Errors.h"
#include "utils.h"
#include <iterator>
#include <queue>
#include <stdexcept>

namespace {
    /**
     * BFS from `start` in the moral graph that never enters a `blocked` node.
     *
     * @param reached If not null, receives every node visited (start nodes included).
     * @return The blocked nodes adjacent to the visited region.
     */
    FlatSet bfs_with_marks(const MoralGraph &moral, const FlatSet &start, const FlatSet &blocked,
                           FlatSet *reached = nullptr) {
        std::vector<char> visited(moral.adjacent.size(), 0);
        std::vector<int> marked;
        std::queue<int> queue;
        for (int node: start) {
            visited[node] = 1;
            queue.push(node);
        }
        while (!queue.empty()) {
            int node = queue.front();
            queue.pop();
            for (int n: moral.adjacent[node]) {
                if (visited[n]) { continue; }
                visited[n] = 1;
                if (blocked.find(n) != blocked.end()) {
                    marked.push_back(n);
                } else {
                    queue.push(n);
                }
            }
        }
        if (reached) {
            reached->clear();
            for (int node = 0; node < static_cast<int>(visited.size()); ++node) {
                if (visited[node] && blocked.find(node) == blocked.end()) { reached->insert(node); }
            }
        }
        return FlatSet(marked.begin(), marked.end());
    }
}// namespace

MoralGraph get_moral_ancestral_graph(const CausalDAG &graph, const FlatSet &nodes) {
    MoralGraph moral;
    moral.nodes = graph.get_ancestors(nodes);
    union_in_place(moral.nodes, nodes);
    moral.adjacent.resize(graph.get_number_of_nodes());

    // the closure is ancestral, so every parent of a kept node is kept too
    for (int node: moral.nodes) {
        const FlatSet &parents = graph.get_parents(node);
        for (auto it = parents.begin(); it != parents.end(); ++it) {
            moral.adjacent[node].insert(*it);
            moral.adjacent[*it].insert(node);
            // marry the parents
            for (auto it2 = std::next(it); it2 != parents.end(); ++it2) {
                moral.adjacent[*it].insert(*it2);
                moral.adjacent[*it2].insert(*it);
            }
        }
    }
    return moral;
}

bool is_d_separated_nodes(const CausalDAG &graph, const FlatSet &x, const FlatSet &y,
                          const FlatSet &z) {
    if (x.empty() || y.empty()) { throw std::invalid_argument("d-separation needs two non-empty sets."); }
    if (have_overlap(x, y) || have_overlap(x, z) || have_overlap(y, z)) {
        throw std::invalid_argument("d-separation needs disjoint sets.");
    }
    FlatSet all_nodes = x;
    union_in_place(all_nodes, y);
    union_in_place(all_nodes, z);
    MoralGraph moral = get_moral_ancestral_graph(graph, all_nodes);

    FlatSet reached;
    bfs_with_marks(moral, x, z, &reached);
    return !have_overlap(reached, y);
}

bool is_d_separated(const CausalDAG &graph, const NodeNames &x, const NodeNames &y,
                    const NodeNames &z) {
    return is_d_separated_nodes(graph, graph.to_indices(x), graph.to_indices(y), graph.to_indices(z));
}

FlatSet minimal_d_separator_nodes(const CausalDAG &graph, const FlatSet &x, const FlatSet &y) {
    if (x.empty() || y.empty()) {
        throw std::invalid_argument("A d-separator needs two non-empty sets.");
    }
    if (have_overlap(x, y)) {
        throw NoAdjustmentSetError("A node cannot be separated from itself.");
    }
    auto logger = get_logger();
    FlatSet xy = x;
    union_in_place(xy, y);
    MoralGraph moral = get_moral_ancestral_graph(graph, xy);

    FlatSet candidates = moral.nodes;
    difference_in_place(candidates, xy);

    FlatSet reached;
    FlatSet separator_x = bfs_with_marks(moral, x, candidates, &reached);
    if (have_overlap(reached, y)) {
        throw NoAdjustmentSetError("No set of variables d-separates " + join_names(graph.to_names(x)) +
                                   " from " + join_names(graph.to_names(y)) + ".");
    }
    logger->trace("Separator candidates: {}, after search from treatments: {}", candidates.size(),
                  separator_x.size());
    return bfs_with_marks(moral, y, separator_x);
}

NodeNames minimal_d_separator(const CausalDAG &graph, const NodeNames &x, const NodeNames &y) {
    return graph.to_names(minimal_d_separator_nodes(graph, graph.to_indices(x), graph.to_indices(y)));
}

NodeNames get_minimal_adjustment_set(const CausalDAG &graph, const NodeNames &treatments,
                                     const NodeNames &outcomes) {
    if (treatments.empty() || outcomes.empty()) {
        throw NoAdjustmentSetError("An adjustment set needs at least one treatment and one outcome.");
    }
    if (have_overlap(treatments, outcomes)) {
        throw NoAdjustmentSetError("Treatments and outcomes overlap.");
    }
    auto start_time = high_resolution_clock::now();
    CausalDAG proper_backdoor_graph = get_proper_backdoor_graph(graph, treatments, outcomes);
    FlatSet treatment_nodes = proper_backdoor_graph.to_indices(treatments);
    FlatSet outcome_nodes = proper_backdoor_graph.to_indices(outcomes);

    NodeNames adjustment_set = proper_backdoor_graph.to_names(
            minimal_d_separator_nodes(proper_backdoor_graph, treatment_nodes, outcome_nodes));
    get_logger()->debug("Minimal adjustment set for {} -> {}: {} ({}s)", join_names(treatments),
                        join_names(outcomes), join_names(adjustment_set), measure_time(start_time));
    return adjustment_set;
}
