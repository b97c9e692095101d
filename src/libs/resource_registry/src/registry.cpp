#include <resource_registry/registry.hpp>
#include <algorithm>
#include <mutex>
#include <utility>

namespace resource_registry {

void Registry::add(const std::string& kind, std::shared_ptr<const ResourceHandler> handler) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    handlers_[kind] = std::move(handler);
}

void Registry::add(std::shared_ptr<const ResourceHandler> handler) {
    if (!handler) return;
    const std::string kind = handler->resource_kind();
    add(kind, std::move(handler));
}

std::shared_ptr<const ResourceHandler> Registry::find(const std::string& kind) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = handlers_.find(kind);
    if (it == handlers_.end()) return nullptr;
    return it->second;
}

bool Registry::contains(const std::string& kind) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return handlers_.count(kind) != 0;
}

std::vector<std::string> Registry::kinds() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        out.reserve(handlers_.size());
        for (const auto& kv : handlers_)
            out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t Registry::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return handlers_.size();
}

} // namespace resource_registry
