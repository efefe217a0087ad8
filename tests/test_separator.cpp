//
// Created by the causal_adjust developers on 10/19/26.
//
#include <gtest/gtest.h>
#include "Backdoor.h"
#include "Errors.h"
#include "Separator.h"

// Check that `separator` blocks every path and that no node of it can be dropped.
static void expect_minimal_separator(const CausalDAG &graph, const NodeNames &x, const NodeNames &y,
                                     const NodeNames &separator) {
    EXPECT_TRUE(is_d_separated(graph, x, y, separator));
    for (auto &node: separator) {
        NodeNames smaller = separator;
        smaller.erase(node);
        EXPECT_FALSE(is_d_separated(graph, x, y, smaller)) << node << " can be removed";
    }
}

// ─── d-separation ──────────────────────────────────────────────

TEST(SeparatorTest, ChainIsBlockedByMiddleNode) {
    CausalDAG dag;
    dag.add_edges({{"A", "B"}, {"B", "C"}});
    EXPECT_FALSE(is_d_separated(dag, {"A"}, {"C"}, {}));
    EXPECT_TRUE(is_d_separated(dag, {"A"}, {"C"}, {"B"}));
}

TEST(SeparatorTest, ColliderOpensWhenConditioned) {
    CausalDAG dag;
    dag.add_edges({{"A", "B"}, {"C", "B"}, {"B", "D"}});
    EXPECT_TRUE(is_d_separated(dag, {"A"}, {"C"}, {}));
    EXPECT_FALSE(is_d_separated(dag, {"A"}, {"C"}, {"B"}));
    // conditioning on a descendant of the collider opens it too
    EXPECT_FALSE(is_d_separated(dag, {"A"}, {"C"}, {"D"}));
}

TEST(SeparatorTest, DSeparationNeedsDisjointSets) {
    CausalDAG dag;
    dag.add_edges({{"A", "B"}, {"B", "C"}});
    EXPECT_THROW(is_d_separated(dag, {"A"}, {"C"}, {"A"}), std::invalid_argument);
    EXPECT_THROW(is_d_separated(dag, {"A"}, {}, {"B"}), std::invalid_argument);
}

// ─── Minimal d-separator ───────────────────────────────────────

TEST(SeparatorTest, MinimalSeparatorPrefersNodesNearTreatment) {
    CausalDAG dag;
    dag.add_edges({{"Z1", "T"}, {"Z1", "Z2"}, {"Z2", "Y"}});
    NodeNames separator = minimal_d_separator(dag, {"T"}, {"Y"});
    EXPECT_EQ(separator, NodeNames{"Z1"});
    expect_minimal_separator(dag, {"T"}, {"Y"}, separator);
}

TEST(SeparatorTest, MinimalSeparatorOfAdjacentNodesThrows) {
    CausalDAG dag;
    dag.add_edges({{"A", "B"}});
    EXPECT_THROW(minimal_d_separator(dag, {"A"}, {"B"}), NoAdjustmentSetError);
}

TEST(SeparatorTest, MarriedParentsCannotBeSeparated) {
    // C is an ancestor of T2, so the collider T1 -> C <- Y cannot stay closed
    CausalDAG dag;
    dag.add_edges({{"T1", "C"}, {"Y", "C"}, {"C", "T2"}});
    EXPECT_THROW(minimal_d_separator(dag, {"T1", "T2"}, {"Y"}), NoAdjustmentSetError);
}

// ─── Minimal adjustment set ────────────────────────────────────

TEST(SeparatorTest, VaccineConfoundedByAge) {
    CausalDAG dag;
    dag.add_edge("Age", "Vaccine");
    dag.add_edge("Age", "Infections");
    dag.add_edge("Vaccine", "Infections");
    EXPECT_EQ(proper_causal_pathway(dag, {"Vaccine"}, {"Infections"}), NodeNames{});
    EXPECT_EQ(dag.get_minimal_adjustment_set({"Vaccine"}, {"Infections"}), NodeNames{"Age"});
}

TEST(SeparatorTest, DisconnectedTreatmentAndOutcome) {
    CausalDAG dag;
    dag.add_edges({{"A", "T"}, {"B", "Y"}});
    EXPECT_EQ(get_minimal_adjustment_set(dag, {"T"}, {"Y"}), NodeNames{});
}

// T -> Y is itself a proper causal path, so its first edge is dropped from the proper
// back-door graph (Zander et al. 2019, Def. 3). Nothing confounds the effect and the
// empty set is returned, rather than NoAdjustmentSetError. The same rule gives {Age}
// in VaccineConfoundedByAge, where Vaccine -> Infections is also a direct edge.
TEST(SeparatorTest, DirectEffectOnlyNeedsNoAdjustment) {
    CausalDAG dag;
    dag.add_edge("T", "Y");
    EXPECT_EQ(get_minimal_adjustment_set(dag, {"T"}, {"Y"}), NodeNames{});
}

TEST(SeparatorTest, OutcomeCausingTreatmentHasNoAdjustmentSet) {
    CausalDAG dag;
    dag.add_edges({{"Y", "T"}, {"W", "T"}, {"W", "Y"}});
    EXPECT_THROW(get_minimal_adjustment_set(dag, {"T"}, {"Y"}), NoAdjustmentSetError);
}

TEST(SeparatorTest, DegenerateQueries) {
    CausalDAG dag;
    dag.add_edges({{"W", "T"}, {"W", "Y"}, {"T", "Y"}});
    EXPECT_THROW(get_minimal_adjustment_set(dag, {}, {"Y"}), NoAdjustmentSetError);
    EXPECT_THROW(get_minimal_adjustment_set(dag, {"T"}, {}), NoAdjustmentSetError);
    EXPECT_THROW(get_minimal_adjustment_set(dag, {"T"}, {"T", "Y"}), NoAdjustmentSetError);
    EXPECT_THROW(get_minimal_adjustment_set(dag, {"T"}, {"Height"}), UnknownNodeError);
}

TEST(SeparatorTest, MediatorIsNotAdjustedFor) {
    CausalDAG dag;
    dag.add_edges({{"W", "T"}, {"W", "Y"}, {"T", "M"}, {"M", "Y"}});
    EXPECT_EQ(get_minimal_adjustment_set(dag, {"T"}, {"Y"}), NodeNames{"W"});
}

TEST(SeparatorTest, MBiasColliderIsLeftAlone) {
    // adjusting for M would open T <- A -> M <- B -> Y
    CausalDAG dag;
    dag.add_edges({{"A", "T"}, {"A", "M"}, {"B", "M"}, {"B", "Y"}, {"T", "Y"}});
    EXPECT_EQ(get_minimal_adjustment_set(dag, {"T"}, {"Y"}), NodeNames{});
}

TEST(SeparatorTest, SeveralBackdoorPaths) {
    CausalDAG dag;
    dag.add_edges({{"A", "T"}, {"A", "B"}, {"B", "Y"}, {"C", "T"}, {"C", "Y"}, {"D", "C"},
                   {"T", "M"}, {"M", "Y"}, {"E", "Y"}});
    NodeNames adjustment_set = get_minimal_adjustment_set(dag, {"T"}, {"Y"});
    EXPECT_EQ(adjustment_set, (NodeNames{"A", "C"}));
    expect_minimal_separator(get_proper_backdoor_graph(dag, {"T"}, {"Y"}), {"T"}, {"Y"}, adjustment_set);
}

TEST(SeparatorTest, SeveralTreatments) {
    CausalDAG dag;
    dag.add_edges({{"U", "T1"}, {"U", "Y"}, {"T1", "Y"}, {"T2", "Y"}, {"V", "T2"}});
    NodeNames adjustment_set = get_minimal_adjustment_set(dag, {"T1", "T2"}, {"Y"});
    EXPECT_EQ(adjustment_set, NodeNames{"U"});
    expect_minimal_separator(get_proper_backdoor_graph(dag, {"T1", "T2"}, {"Y"}), {"T1", "T2"}, {"Y"},
                             adjustment_set);
}

TEST(SeparatorTest, AdjustmentSetIsDisjointFromQuery) {
    CausalDAG dag;
    dag.add_edges({{"U", "T"}, {"U", "Y1"}, {"T", "Y1"}, {"Y1", "Y2"}, {"V", "Y2"}, {"V", "T"}});
    NodeNames adjustment_set = get_minimal_adjustment_set(dag, {"T"}, {"Y1", "Y2"});
    for (auto &name: {"T", "Y1", "Y2"}) { EXPECT_EQ(adjustment_set.count(name), 0); }
    expect_minimal_separator(get_proper_backdoor_graph(dag, {"T"}, {"Y1", "Y2"}), {"T"}, {"Y1", "Y2"},
                             adjustment_set);
    EXPECT_EQ(adjustment_set, (NodeNames{"U", "V"}));
}
