#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hcl_writer {

constexpr const char* kVersionsFile = "versions.tf";
constexpr const char* kVariablesFile = "variables.tf";
constexpr const char* kMainFile = "main.tf";
constexpr const char* kOutputsFile = "outputs.tf";
constexpr const char* kTfvarsFile = "terraform.tfvars";

// Collects resource fragments and boilerplate sections, then merges them into
// file name -> content. Fragments keep the order they were added in; empty
// sections are left out of the result.
class OutputAssembler {
public:
    explicit OutputAssembler(bool emit_tfvars = true);

    // Empty fragments are ignored.
    void add_resource(std::string fragment);
    void set_versions(std::string content) { versions_ = std::move(content); }
    void set_variables(std::string content) { variables_ = std::move(content); }
    void set_outputs(std::string content) { outputs_ = std::move(content); }
    void set_tfvars(std::string content) { tfvars_ = std::move(content); }

    std::size_t resource_count() const { return resources_.size(); }

    std::map<std::string, std::string> build() const;

private:
    std::vector<std::string> resources_;
    std::string versions_;
    std::string variables_;
    std::string outputs_;
    std::string tfvars_;
    bool emit_tfvars_ = true;
};

} // namespace hcl_writer
