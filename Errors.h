//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include <stdexcept>
#include <string>

// Raised when an edge (or a loaded graph) would make the causal graph cyclic.
// The graph is left in its prior state.
class CycleError : public std::runtime_error {
public:
    explicit CycleError(const std::string &message) : std::runtime_error(message) {}
};

class UnknownNodeError : public std::runtime_error {
public:
    explicit UnknownNodeError(const std::string &node)
        : std::runtime_error(node + " not a node in Causal DAG."), node(node) {}

    const std::string &get_node() const { return node; }

private:
    std::string node;
};

// No set of covariates blocks every backdoor path between treatments and outcomes.
class NoAdjustmentSetError : public std::runtime_error {
public:
    explicit NoAdjustmentSetError(const std::string &message) : std::runtime_error(message) {}
};

class DotParseError : public std::runtime_error {
public:
    explicit DotParseError(const std::string &message) : std::runtime_error(message) {}
};
