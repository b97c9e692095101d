#pragma once

#include <string>

namespace tf_engine {

constexpr int kMaxParallelCap = 32;

struct EngineOptions {
    // Worker threads per tier. <= 0 selects the host's hardware concurrency.
    int max_parallel = 0;
    // Produce terraform.tfvars from the diagram metadata.
    bool emit_tfvars = true;
    // Produce outputs.tf exposing the id of every generated resource.
    bool emit_outputs = true;
    std::string aws_region = "us-east-1";
};

// Resolves max_parallel to a concrete value in [1, kMaxParallelCap].
EngineOptions normalized(EngineOptions options);

} // namespace tf_engine
