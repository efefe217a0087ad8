//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include "CausalDAG.h"
#include <istream>

/**
 * Parse a DOT `digraph` into a CausalDAG.
 *
 * Node ids become variable names; node and edge attributes are ignored.
 *
 * @throws DotParseError on malformed input or an undirected graph.
 * @throws CycleError if the described graph contains a cycle.
 */
CausalDAG read_dot(std::istream &input);
