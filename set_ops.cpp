//
// Created by the causal_adjust developers on 10/19/26.
//
#include "set_ops.h"

void union_in_place(FlatSet &a, const FlatSet &b) {
    // flat_set keeps the ordered range, so a single merge pass is enough
    a.insert(boost::container::ordered_unique_range, b.begin(), b.end());
}

/**
 * Intersect a and b in place.
 *
 * @param a
 * @param b
 */
void intersect_in_place(FlatSet &a, const FlatSet &b) {
    auto it1 = a.begin();
    auto it2 = b.begin();
    while ((it1 != a.end()) && (it2 != b.end())) {
        if (*it1 < *it2) {
            it1 = a.erase(it1);
        } else if (*it2 < *it1) {
            ++it2;
        } else {// *it1 == *it2
            ++it1;
            ++it2;
        }
    }
    a.erase(it1, a.end());
}

void difference_in_place(FlatSet &a, const FlatSet &b) {
    if (a.empty() || b.empty()) { return; }
    auto it = a.begin();
    while (it != a.end()) {
        if (b.find(*it) != b.end()) {
            it = a.erase(it);
        } else {
            ++it;
        }
    }
}

std::string join_names(const NodeNames &names) {
    std::string result = "{";
    for (auto &name: names) { result += name + ", "; }
    if (!names.empty()) {
        result.pop_back();
        result.pop_back();
    }
    result += "}";
    return result;
}
