#include <tf_engine/engine.hpp>
#include <tf_engine/logging.hpp>
#include <tf_engine/worker_pool.hpp>
#include <dependency_graph/resolver.hpp>
#include <diagram_model/validate.hpp>
#include <hcl_writer/hcl.hpp>
#include <hcl_writer/output_assembler.hpp>
#include <hcl_writer/templates.hpp>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tf_engine {

namespace {

using diagram_model::Issue;
using diagram_model::IssueType;

// Result of validate+generate for one node.
struct NodeOutcome {
    std::size_t position = 0; // index in diagram.nodes
    std::string node_id;
    std::string resource_type;
    std::string artifact;
    std::vector<Issue> errors;
    std::vector<Issue> warnings;
};

// Units of one tier push here from worker threads; the engine waits for the
// expected count, then reorders by declaration position before merging.
class TierAccumulator {
public:
    explicit TierAccumulator(std::size_t expected) : expected_(expected) {}

    void push(NodeOutcome outcome) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            outcomes_.push_back(std::move(outcome));
        }
        cv_.notify_one();
    }

    std::vector<NodeOutcome> wait_and_take() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return outcomes_.size() >= expected_; });
        std::vector<NodeOutcome> out = std::move(outcomes_);
        std::sort(out.begin(), out.end(),
            [](const NodeOutcome& a, const NodeOutcome& b) { return a.position < b.position; });
        return out;
    }

private:
    const std::size_t expected_;
    std::vector<NodeOutcome> outcomes_;
    std::mutex mu_;
    std::condition_variable cv_;
};

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

NodeOutcome run_unit(const resource_registry::ResourceHandler& handler,
    const diagram_model::Node& node,
    std::size_t position,
    const diagram_model::Diagram& diagram,
    const resource_registry::ReferenceMap& references)
{
    NodeOutcome outcome;
    outcome.position = position;
    outcome.node_id = node.id;

    try {
        outcome.resource_type = handler.resource_type();
        resource_registry::ValidationReport report = handler.validate(node);
        outcome.errors = std::move(report.errors);
        outcome.warnings = std::move(report.warnings);
    } catch (const std::exception& e) {
        outcome.errors.push_back(diagram_model::make_error(IssueType::ValidationError, node.id,
            std::string("validation failed: ") + e.what()));
    } catch (...) {
        outcome.errors.push_back(diagram_model::make_error(IssueType::ValidationError, node.id,
            "handler failed with a non-standard exception"));
    }

    try {
        outcome.artifact = handler.generate(node, diagram, references);
    } catch (const std::exception& e) {
        outcome.errors.push_back(diagram_model::make_error(IssueType::GenerationError, node.id, e.what()));
    } catch (...) {
        outcome.errors.push_back(diagram_model::make_error(IssueType::GenerationError, node.id,
            "handler failed with a non-standard exception"));
    }
    return outcome;
}

} // namespace

const char* to_string(Stage stage) {
    switch (stage) {
    case Stage::Validating: return "validating";
    case Stage::Resolving: return "resolving";
    case Stage::Generating: return "generating";
    case Stage::Assembling: return "assembling";
    case Stage::Done: return "done";
    case Stage::Failed: return "failed";
    }
    return "failed";
}

Engine::Engine(const resource_registry::Registry& registry, EngineOptions options)
    : registry_(registry), options_(normalized(std::move(options)))
{
}

ParseResult Engine::parse(const diagram_model::Diagram& diagram) const {
    auto log = engine_logger();
    Stage stage = Stage::Validating;
    log->debug("[{}] {} nodes, {} edges", to_string(stage), diagram.nodes.size(), diagram.edges.size());

    std::vector<Issue> schema_errors = diagram_model::validate_diagram(diagram);
    if (!schema_errors.empty()) {
        log->info("[{}] diagram rejected with {} schema error(s)", to_string(Stage::Failed), schema_errors.size());
        return ParseResult(false, {}, std::move(schema_errors), {});
    }

    stage = Stage::Resolving;
    const dependency_graph::Resolution resolution = dependency_graph::resolve(diagram);
    if (resolution.has_cycle()) {
        log->info("[{}] dependency cycle among: {}", to_string(Stage::Failed), join(resolution.unresolved));
        std::vector<Issue> errors;
        errors.push_back(diagram_model::make_error(IssueType::DependencyError, {},
            "dependency cycle detected (unresolved nodes: " + join(resolution.unresolved) + ")",
            "Remove circular edges or fix node references"));
        return ParseResult(false, {}, std::move(errors), {});
    }
    log->debug("[{}] {} tier(s)", to_string(stage), resolution.tiers.size());

    std::unordered_map<std::string, std::size_t> position_of;
    for (std::size_t i = 0; i < diagram.nodes.size(); ++i)
        position_of.emplace(diagram.nodes[i].id, i);

    stage = Stage::Generating;
    std::vector<Issue> errors;
    std::vector<Issue> warnings;
    std::vector<std::string> artifacts;
    resource_registry::ReferenceMap references;

    for (std::size_t tier_index = 0; tier_index < resolution.tiers.size(); ++tier_index) {
        const dependency_graph::Tier& tier = resolution.tiers[tier_index];
        log->debug("[{}] tier {}: {} node(s)", to_string(stage), tier_index, tier.size());

        TierAccumulator accumulator(tier.size());
        // Declared after the accumulator: on any exit the pool drains and
        // joins before the accumulator its tasks push to is destroyed.
        WorkerPool pool(std::min(static_cast<std::size_t>(options_.max_parallel), tier.size()));
        for (const std::string& node_id : tier) {
            const std::size_t position = position_of.at(node_id);
            const diagram_model::Node& node = diagram.nodes[position];
            std::shared_ptr<const resource_registry::ResourceHandler> handler = registry_.find(node.kind);
            if (!handler) {
                NodeOutcome outcome;
                outcome.position = position;
                outcome.node_id = node.id;
                outcome.errors.push_back(diagram_model::make_error(IssueType::UnsupportedKind, node.id,
                    "unsupported resource type: " + node.kind,
                    "Use one of: " + join(registry_.kinds())));
                accumulator.push(std::move(outcome));
                continue;
            }
            // references is only written after wait_and_take() below.
            pool.submit([&accumulator, handler, &node, position, &diagram, &references] {
                accumulator.push(run_unit(*handler, node, position, diagram, references));
            });
        }

        std::vector<NodeOutcome> outcomes = accumulator.wait_and_take();
        for (auto& o : outcomes) {
            for (auto& e : o.errors)
                errors.push_back(std::move(e));
            for (auto& w : o.warnings)
                warnings.push_back(std::move(w));
        }
        for (auto& o : outcomes) {
            if (o.artifact.empty()) continue;
            if (!references.add(o.node_id, o.resource_type + "." + hcl_writer::sanitize_name(o.node_id)))
                log->warn("[{}] node {} already has an address; keeping the first", to_string(stage), o.node_id);
            artifacts.push_back(std::move(o.artifact));
        }
    }

    if (!errors.empty()) {
        log->info("[{}] {} error(s), {} warning(s); no files produced", to_string(Stage::Failed), errors.size(),
            warnings.size());
        return ParseResult(false, {}, std::move(errors), std::move(warnings));
    }

    stage = Stage::Assembling;
    log->debug("[{}] {} artifact(s)", to_string(stage), artifacts.size());
    hcl_writer::OutputAssembler assembler(options_.emit_tfvars);
    assembler.set_versions(hcl_writer::versions_tf());
    assembler.set_variables(hcl_writer::variables_tf(options_.aws_region, diagram.metadata));
    for (auto& a : artifacts)
        assembler.add_resource(std::move(a));
    if (options_.emit_outputs)
        assembler.set_outputs(hcl_writer::outputs_tf(references.entries()));
    if (options_.emit_tfvars)
        assembler.set_tfvars(hcl_writer::tfvars_from_metadata(options_.aws_region, diagram.metadata));

    FileMap files = assembler.build();
    log->info("[{}] {} resource(s), {} file(s), {} warning(s)", to_string(Stage::Done), assembler.resource_count(),
        files.size(), warnings.size());
    return ParseResult(true, std::move(files), {}, std::move(warnings));
}

} // namespace tf_engine
