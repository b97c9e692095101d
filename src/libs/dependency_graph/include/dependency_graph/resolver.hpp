#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace dependency_graph {

using Tier = std::vector<std::string>;

struct Resolution {
    // Node ids, dependencies first. Concatenation of tiers.
    std::vector<std::string> ordered;
    // tiers[i] holds nodes whose every dependency lies in tiers[0..i-1].
    // Within a tier, ids keep the diagram's declaration order.
    std::vector<Tier> tiers;
    // Set only on a cycle: nodes never released, in declaration order.
    // ordered/tiers are empty in that case.
    std::vector<std::string> unresolved;

    bool has_cycle() const { return !unresolved.empty(); }
};

// Kahn tiering over diagram edges. An edge source -> target makes target
// depend on source regardless of its kind. Self-loops and edges with a
// dangling endpoint are ignored.
Resolution resolve(const diagram_model::Diagram& diagram);

} // namespace dependency_graph
