//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include "CausalDAG.h"

/**
 * The back-door graph of `graph` for `treatments`: a copy with every edge leaving a
 * treatment deleted.
 *
 * @throws UnknownNodeError if a treatment is not a node of `graph`.
 */
CausalDAG get_backdoor_graph(const CausalDAG &graph, const NodeNames &treatments);

/**
 * Nodes lying on a proper causal path from the treatments to the outcomes.
 *
 * PCP(T, O) = (De(T) \ T) ∩ An_B(O), where De(T) are the descendants of the treatments and
 * An_B(O) the ancestors of the outcomes in the back-door graph B of T. Outcomes are not
 * their own ancestors, so they are never part of the result.
 *
 * @throws std::invalid_argument if `treatments` or `outcomes` is empty.
 * @throws UnknownNodeError if a name is not a node of `graph`.
 */
NodeNames proper_causal_pathway(const CausalDAG &graph, const NodeNames &treatments,
                                const NodeNames &outcomes);

FlatSet proper_causal_pathway_nodes(const CausalDAG &graph, const FlatSet &treatments,
                                    const FlatSet &outcomes);

/**
 * The proper back-door graph: a copy of `graph` without the first edge of every proper
 * causal path from the treatments to the outcomes, i.e. the edges t -> v with t a treatment
 * and v either on a proper causal pathway or an outcome that is not itself a treatment.
 *
 * Reference: Zander, Liśkiewicz and Textor, "Separators and adjustment sets in causal
 * graphs: complete criteria and an algorithmic framework", 2019, Definition 3.
 *
 * @throws UnknownNodeError naming the first treatment, then outcome, missing from `graph`.
 * @throws std::invalid_argument if `treatments` or `outcomes` is empty.
 */
CausalDAG get_proper_backdoor_graph(const CausalDAG &graph, const NodeNames &treatments,
                                    const NodeNames &outcomes);
