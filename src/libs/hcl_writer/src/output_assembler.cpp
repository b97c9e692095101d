#include <hcl_writer/output_assembler.hpp>
#include <utility>

namespace hcl_writer {

OutputAssembler::OutputAssembler(bool emit_tfvars)
    : emit_tfvars_(emit_tfvars)
{
}

void OutputAssembler::add_resource(std::string fragment) {
    if (fragment.empty()) return;
    resources_.push_back(std::move(fragment));
}

std::map<std::string, std::string> OutputAssembler::build() const {
    std::map<std::string, std::string> out;
    if (!versions_.empty()) out[kVersionsFile] = versions_;
    if (!variables_.empty()) out[kVariablesFile] = variables_;

    // Exactly one blank line between fragments.
    std::string main_tf;
    for (const auto& fragment : resources_) {
        if (!main_tf.empty()) {
            if (main_tf.back() != '\n') main_tf += '\n';
            main_tf += '\n';
        }
        main_tf += fragment;
    }
    if (!main_tf.empty()) out[kMainFile] = std::move(main_tf);

    if (!outputs_.empty()) out[kOutputsFile] = outputs_;
    if (emit_tfvars_ && !tfvars_.empty()) out[kTfvarsFile] = tfvars_;
    return out;
}

} // namespace hcl_writer
