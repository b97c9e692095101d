#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <utility>
#include <vector>

namespace hcl_writer {

// terraform block (required_version, required_providers.aws) and the aws provider.
std::string versions_tf();

// variable "aws_region" with the given default, plus variable "environment"
// when the diagram names one.
std::string variables_tf(const std::string& default_region, const diagram_model::Metadata& metadata);

// One output "<name>_id" per (node id, address) pair, in the given order.
std::string outputs_tf(const std::vector<std::pair<std::string, std::string>>& references);

std::string tfvars_from_metadata(const std::string& region, const diagram_model::Metadata& metadata);

} // namespace hcl_writer
