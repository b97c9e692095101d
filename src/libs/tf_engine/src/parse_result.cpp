#include <tf_engine/parse_result.hpp>
#include <utility>

namespace tf_engine {

ParseResult::ParseResult(bool success, FileMap files,
    std::vector<diagram_model::Issue> errors,
    std::vector<diagram_model::Issue> warnings)
    : success_(success && errors.empty())
    , files_(success_ ? std::move(files) : FileMap{})
    , errors_(std::move(errors))
    , warnings_(std::move(warnings))
{
}

nlohmann::json to_json(const diagram_model::Issue& issue) {
    nlohmann::json j;
    j["type"] = diagram_model::to_string(issue.type);
    j["severity"] = diagram_model::to_string(issue.severity);
    if (!issue.node_id.empty()) j["node_id"] = issue.node_id;
    j["message"] = issue.message;
    if (!issue.suggestion.empty()) j["suggestion"] = issue.suggestion;
    return j;
}

nlohmann::json to_json(const ParseResult& result) {
    nlohmann::json j;
    j["success"] = result.success();
    j["files"] = nlohmann::json::array();
    for (const auto& kv : result.files())
        j["files"].push_back(kv.first);
    if (!result.errors().empty()) {
        j["errors"] = nlohmann::json::array();
        for (const auto& e : result.errors())
            j["errors"].push_back(to_json(e));
    }
    if (!result.warnings().empty()) {
        j["warnings"] = nlohmann::json::array();
        for (const auto& w : result.warnings())
            j["warnings"].push_back(to_json(w));
    }
    return j;
}

} // namespace tf_engine
