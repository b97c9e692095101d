// diagram2tf: infrastructure diagram JSON -> Terraform files (C++20)

#include <diagram_loaders/json_loader.hpp>
#include <diagram_loaders/sample_diagram.hpp>
#include <resource_handlers/aws_handlers.hpp>
#include <resource_registry/registry.hpp>
#include <tf_engine/engine.hpp>
#include <tf_engine/logging.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct CliOptions {
    std::string input;
    std::string output_dir = "output";
    bool json = false;
    bool list_kinds = false;
    bool sample = false;
    std::string log_level = "warn";
    std::string log_file;
    tf_engine::EngineOptions engine;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: diagram2tf --input <file|-> [-o <dir>] [--no-tfvars] [--no-outputs]\n"
        "                  [--parallel N] [--region R] [--json]\n"
        "                  [--log-level L] [--log-file F]\n"
        "       diagram2tf --sample [-o <dir>]\n"
        "       diagram2tf --list-kinds\n");
}

// Returns nullopt after printing a message when argv is malformed.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "missing value for %s\n", arg.c_str());
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "--input" || arg == "-input" || arg == "-i") {
            if (!value(opts.input)) return std::nullopt;
        } else if (arg == "-o" || arg == "--output") {
            if (!value(opts.output_dir)) return std::nullopt;
        } else if (arg == "--no-tfvars" || arg == "-no-tfvars") {
            opts.engine.emit_tfvars = false;
        } else if (arg == "--no-outputs") {
            opts.engine.emit_outputs = false;
        } else if (arg == "--parallel" || arg == "-parallel") {
            if (!value(v)) return std::nullopt;
            try {
                opts.engine.max_parallel = std::stoi(v);
            } catch (const std::exception&) {
                (void)fprintf(stderr, "invalid --parallel value: %s\n", v.c_str());
                return std::nullopt;
            }
        } else if (arg == "--region") {
            if (!value(opts.engine.aws_region)) return std::nullopt;
        } else if (arg == "--json" || arg == "-json") {
            opts.json = true;
        } else if (arg == "--list-kinds") {
            opts.list_kinds = true;
        } else if (arg == "--sample") {
            opts.sample = true;
        } else if (arg == "--log-level") {
            if (!value(opts.log_level)) return std::nullopt;
        } else if (arg == "--log-file") {
            if (!value(opts.log_file)) return std::nullopt;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return std::nullopt;
        } else {
            (void)fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return std::nullopt;
        }
    }
    if (opts.input.empty() && !opts.sample && !opts.list_kinds) {
        print_usage();
        return std::nullopt;
    }
    return opts;
}

void print_issues(const tf_engine::ParseResult& result) {
    for (const auto& e : result.errors()) {
        (void)fprintf(stderr, "ERROR [%s] %s\n", e.node_id.c_str(), e.message.c_str());
        if (!e.suggestion.empty())
            (void)fprintf(stderr, "  suggestion: %s\n", e.suggestion.c_str());
    }
    for (const auto& w : result.warnings())
        (void)fprintf(stderr, "WARN [%s] %s\n", w.node_id.c_str(), w.message.c_str());
}

bool write_files(const tf_engine::FileMap& files, const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        (void)fprintf(stderr, "mkdir %s: %s\n", dir.string().c_str(), ec.message().c_str());
        return false;
    }
    for (const auto& [name, content] : files) {
        const std::filesystem::path path = dir / name;
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f << content;
        if (!f) {
            (void)fprintf(stderr, "write %s failed\n", path.string().c_str());
            return false;
        }
        (void)printf("wrote %s\n", path.string().c_str());
    }
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    const std::optional<CliOptions> opts = parse_args(argc, argv);
    if (!opts) return 1;

    if (!tf_engine::set_log_level(opts->log_level)) {
        (void)fprintf(stderr, "unknown log level: %s\n", opts->log_level.c_str());
        return 1;
    }
    if (!opts->log_file.empty() && !tf_engine::add_log_file(opts->log_file))
        return 1;

    resource_registry::Registry registry;
    resource_handlers::register_builtin_handlers(registry);

    if (opts->list_kinds) {
        for (const auto& kind : registry.kinds())
            (void)printf("%s\n", kind.c_str());
        return 0;
    }

    std::optional<diagram_model::Diagram> diagram;
    if (opts->sample) {
        diagram = diagram_loaders::generate_sample_diagram();
    } else if (opts->input == "-") {
        diagram = diagram_loaders::load_diagram_from_json(std::cin);
    } else {
        diagram = diagram_loaders::load_diagram_from_json_file(opts->input);
    }
    if (!diagram) {
        (void)fprintf(stderr, "cannot read diagram JSON from %s\n", opts->input.c_str());
        return 1;
    }

    tf_engine::Engine engine(registry, opts->engine);
    const tf_engine::ParseResult result = engine.parse(*diagram);

    if (!result.success()) {
        if (opts->json) {
            (void)printf("%s\n", tf_engine::to_json(result).dump(2).c_str());
        } else {
            print_issues(result);
        }
        return 1;
    }

    for (const auto& w : result.warnings())
        (void)fprintf(stderr, "WARN [%s] %s\n", w.node_id.c_str(), w.message.c_str());
    return write_files(result.files(), opts->output_dir) ? 0 : 1;
}
