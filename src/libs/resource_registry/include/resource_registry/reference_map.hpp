#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace resource_registry {

// node id -> symbolic address of the generated resource (e.g. "aws_vpc.main_vpc").
// Append-only; entries keep insertion order. Written by the engine between
// tiers only, handlers see it through a const reference.
class ReferenceMap {
public:
    // Returns false (and keeps the existing address) if node_id is already present.
    bool add(const std::string& node_id, std::string address);

    const std::string* find(const std::string& node_id) const;
    bool contains(const std::string& node_id) const { return index_.count(node_id) != 0; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

// "<address>.<attribute>", e.g. reference_to("aws_vpc.main", "id") == "aws_vpc.main.id".
std::string reference_to(const std::string& address, const std::string& attribute);

} // namespace resource_registry
