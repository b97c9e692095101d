#pragma once

#include <diagram_model/issue.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace tf_engine {

// file name -> content
using FileMap = std::map<std::string, std::string>;

// Outcome of one Engine::parse call. files is empty whenever success is false.
class ParseResult {
public:
    ParseResult(bool success, FileMap files,
        std::vector<diagram_model::Issue> errors,
        std::vector<diagram_model::Issue> warnings);

    bool success() const { return success_; }
    const FileMap& files() const { return files_; }
    const std::vector<diagram_model::Issue>& errors() const { return errors_; }
    const std::vector<diagram_model::Issue>& warnings() const { return warnings_; }

private:
    bool success_ = false;
    FileMap files_;
    std::vector<diagram_model::Issue> errors_;
    std::vector<diagram_model::Issue> warnings_;
};

nlohmann::json to_json(const diagram_model::Issue& issue);
// {success, files: [names], errors: [...], warnings: [...]}; file contents are not included.
nlohmann::json to_json(const ParseResult& result);

} // namespace tf_engine
