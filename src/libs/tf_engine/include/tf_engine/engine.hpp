#pragma once

#include <diagram_model/types.hpp>
#include <resource_registry/registry.hpp>
#include <tf_engine/options.hpp>
#include <tf_engine/parse_result.hpp>

namespace tf_engine {

enum class Stage { Validating, Resolving, Generating, Assembling, Done, Failed };

const char* to_string(Stage stage);

// Turns a diagram into Terraform files.
//
// Validating and Resolving are fail-fast: a schema problem or a dependency
// cycle ends the run with just those errors. Generating walks the dependency
// tiers in order; nodes of one tier are validated and generated concurrently
// on a pool of options.max_parallel workers, and every node of every tier is
// attempted even after an error so a single run reports all of them.
// Artifacts are merged in tier order and, within a tier, in declaration
// order, so output does not depend on scheduling. Assembling runs only when
// no error was recorded.
//
// The registry must outlive the engine and is not modified by it.
class Engine {
public:
    explicit Engine(const resource_registry::Registry& registry, EngineOptions options = {});

    ParseResult parse(const diagram_model::Diagram& diagram) const;

    const EngineOptions& options() const { return options_; }

private:
    const resource_registry::Registry& registry_;
    EngineOptions options_;
};

} // namespace tf_engine
