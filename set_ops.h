//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <set>
#include <string>

typedef boost::container::flat_set<int, std::less<int>, boost::container::small_vector<int, 10>> FlatSet;

// Variable names at the API boundary. Ordered, so results are deterministic.
typedef std::set<std::string> NodeNames;


template<typename T>
bool have_overlap(const T &a, const T &b) {
    if (a.empty() || b.empty()) { return false; }
    if (a.size() > b.size()) { return have_overlap(b, a); }
    for (auto &i: a) {
        if (b.find(i) != b.end()) { return true; }
    }
    return false;
}

void union_in_place(FlatSet &a, const FlatSet &b);

void intersect_in_place(FlatSet &a, const FlatSet &b);

void difference_in_place(FlatSet &a, const FlatSet &b);

std::string join_names(const NodeNames &names);
