#pragma once

#include <diagram_model/issue.hpp>
#include <diagram_model/types.hpp>
#include <resource_registry/reference_map.hpp>
#include <string>
#include <vector>

namespace resource_registry {

struct ValidationReport {
    std::vector<diagram_model::Issue> errors;
    std::vector<diagram_model::Issue> warnings;
};

// One implementation per diagram node kind. Implementations keep no state
// between calls; the engine invokes them concurrently from worker threads.
class ResourceHandler {
public:
    virtual ~ResourceHandler() = default;

    // Diagram kind handled, e.g. "vpc".
    virtual std::string resource_kind() const = 0;
    // Generated resource type, e.g. "aws_vpc". Prefix of the node's symbolic address.
    virtual std::string resource_type() const = 0;

    // Property checks on a single node.
    virtual ValidationReport validate(const diagram_model::Node& node) const = 0;

    // Renders the node's artifact. References hold addresses of nodes in
    // earlier tiers only. Throws on failure; the caller reports the message
    // as a generation_error for this node.
    virtual std::string generate(const diagram_model::Node& node,
        const diagram_model::Diagram& diagram,
        const ReferenceMap& references) const = 0;
};

} // namespace resource_registry
