#include <dependency_graph/resolver.hpp>
#include <algorithm>
#include <unordered_map>

namespace dependency_graph {

Resolution resolve(const diagram_model::Diagram& diagram) {
    Resolution out;
    if (diagram.nodes.empty()) return out;

    // Declaration position of each distinct id (first occurrence wins).
    std::unordered_map<std::string, std::size_t> position;
    std::vector<std::size_t> distinct;
    for (std::size_t i = 0; i < diagram.nodes.size(); ++i) {
        if (position.emplace(diagram.nodes[i].id, i).second)
            distinct.push_back(i);
    }

    // successors[u] = positions of targets of edges leaving u; one entry per
    // edge so parallel edges decrement the in-degree they contributed.
    std::vector<std::size_t> in_degree(diagram.nodes.size(), 0);
    std::vector<std::vector<std::size_t>> successors(diagram.nodes.size());
    for (const auto& e : diagram.edges) {
        const auto src = position.find(e.source_node_id);
        const auto tgt = position.find(e.target_node_id);
        if (src == position.end() || tgt == position.end() || src->second == tgt->second)
            continue;
        successors[src->second].push_back(tgt->second);
        ++in_degree[tgt->second];
    }

    std::vector<std::size_t> current;
    for (std::size_t pos : distinct) {
        if (in_degree[pos] == 0) current.push_back(pos);
    }

    std::vector<bool> emitted(diagram.nodes.size(), false);
    std::vector<Tier> tiers;
    std::vector<std::string> ordered;
    ordered.reserve(distinct.size());
    while (!current.empty()) {
        Tier tier;
        tier.reserve(current.size());
        std::vector<std::size_t> next;
        for (std::size_t u : current) {
            emitted[u] = true;
            tier.push_back(diagram.nodes[u].id);
            ordered.push_back(diagram.nodes[u].id);
            for (std::size_t v : successors[u]) {
                if (--in_degree[v] == 0) next.push_back(v);
            }
        }
        tiers.push_back(std::move(tier));
        std::sort(next.begin(), next.end());
        current = std::move(next);
    }

    if (ordered.size() < distinct.size()) {
        for (std::size_t pos : distinct) {
            if (!emitted[pos]) out.unresolved.push_back(diagram.nodes[pos].id);
        }
        return out;
    }

    out.ordered = std::move(ordered);
    out.tiers = std::move(tiers);
    return out;
}

} // namespace dependency_graph
