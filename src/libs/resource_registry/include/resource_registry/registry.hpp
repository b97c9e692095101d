#pragma once

#include <resource_registry/resource_handler.hpp>
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace resource_registry {

// kind -> handler. Reads take a shared lock so lookups from engine workers
// never block each other; add() takes the exclusive lock.
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Replaces any handler already registered for kind.
    void add(const std::string& kind, std::shared_ptr<const ResourceHandler> handler);
    // Registers under handler->resource_kind().
    void add(std::shared_ptr<const ResourceHandler> handler);

    // Null when no handler is registered for kind.
    std::shared_ptr<const ResourceHandler> find(const std::string& kind) const;
    bool contains(const std::string& kind) const;

    // Registered kinds, sorted.
    std::vector<std::string> kinds() const;
    std::size_t size() const;

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<const ResourceHandler>> handlers_;
};

} // namespace resource_registry
