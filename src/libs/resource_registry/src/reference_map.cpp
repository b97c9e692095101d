#include <resource_registry/reference_map.hpp>

namespace resource_registry {

bool ReferenceMap::add(const std::string& node_id, std::string address) {
    if (index_.count(node_id) != 0) return false;
    index_.emplace(node_id, entries_.size());
    entries_.emplace_back(node_id, std::move(address));
    return true;
}

const std::string* ReferenceMap::find(const std::string& node_id) const {
    auto it = index_.find(node_id);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

std::string reference_to(const std::string& address, const std::string& attribute) {
    if (attribute.empty()) return address;
    return address + "." + attribute;
}

} // namespace resource_registry
