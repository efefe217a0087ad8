//
// Created by the causal_adjust developers on 10/19/26.
//
#include "DotReader.h"
#include "Errors.h"
#include "utils.h"
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/graphviz.hpp>
#include <boost/range/iterator_range.hpp>

namespace {
    struct DotVertex {
        std::string name;
    };

    // vecS out-edges: repeated edges in the file are merged by CausalDAG, not rejected by the parser
    typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS, DotVertex> DotGraph;
}// namespace

CausalDAG read_dot(std::istream &input) {
    DotGraph dot_graph;
    boost::dynamic_properties properties(boost::ignore_other_properties);
    properties.property("node_id", boost::get(&DotVertex::name, dot_graph));

    try {
        if (!boost::read_graphviz(input, dot_graph, properties, "node_id")) {
            throw DotParseError("Could not read DOT graph.");
        }
    } catch (const boost::undirected_graph_error &) {
        throw DotParseError("A causal DAG must be a digraph, got an undirected graph.");
    } catch (const boost::graph_exception &e) {
        throw DotParseError(std::string("Malformed DOT graph: ") + e.what());
    }

    CausalDAG dag;
    for (auto vertex: boost::make_iterator_range(boost::vertices(dot_graph))) {
        dag.add_node(dot_graph[vertex].name);
    }
    std::vector<NamedEdge> edges;
    edges.reserve(boost::num_edges(dot_graph));
    for (auto edge: boost::make_iterator_range(boost::edges(dot_graph))) {
        edges.emplace_back(dot_graph[boost::source(edge, dot_graph)].name,
                           dot_graph[boost::target(edge, dot_graph)].name);
    }
    dag.add_edges(edges);
    get_logger()->debug("Read DOT graph with {} nodes and {} edges", dag.get_number_of_nodes(),
                        dag.get_number_of_edges());
    return dag;
}
