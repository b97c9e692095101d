#pragma once

#include <string>
#include <utility>

namespace diagram_model {

enum class IssueType {
    SchemaError,      // structural, fail-fast before resolution
    DependencyError,  // cycle, fail-fast before generation
    ValidationError,  // per-node property problem
    GenerationError,  // handler-internal failure
    UnsupportedKind,  // no handler registered for node.kind
    BestPractice      // warnings only
};

enum class Severity { Error, Warning };

struct Issue {
    IssueType type = IssueType::ValidationError;
    Severity severity = Severity::Error;
    std::string node_id;
    std::string message;
    std::string suggestion;
};

const char* to_string(IssueType type);
const char* to_string(Severity severity);

inline Issue make_error(IssueType type, std::string node_id, std::string message,
    std::string suggestion = {})
{
    return Issue{ type, Severity::Error, std::move(node_id), std::move(message), std::move(suggestion) };
}

inline Issue make_warning(std::string node_id, std::string message, std::string suggestion = {}) {
    return Issue{ IssueType::BestPractice, Severity::Warning, std::move(node_id), std::move(message),
        std::move(suggestion) };
}

} // namespace diagram_model
