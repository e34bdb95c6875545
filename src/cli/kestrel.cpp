#include "cli/kestrel.hpp"

#include "cli/options.hpp"
#include "codegen/file_writer.hpp"
#include "codegen/generator.hpp"
#include "codegen/version.hpp"
#include "idl/json_dump.hpp"
#include "frontend/diagnostic.hpp"
#include "frontend/frontend.hpp"
#include "frontend/semantic/validator.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace kestrel
{

namespace
{

void log_diagnostics(const frontend::DiagnosticSink& diagnostics)
{
    const bool has_any_diagnostics = !diagnostics.diagnostics().empty();

    if (diagnostics.has_errors()) {
        spdlog::error("Semantic analysis failed:");
    } else if (diagnostics.has_warnings()) {
        spdlog::warn("Semantic analysis warnings:");
    } else if (has_any_diagnostics) {
        spdlog::info("Semantic analysis diagnostics:");
    }

    for (const auto& diagnostic : diagnostics.sorted()) {
        const auto log_message = frontend::format(diagnostic);
        switch (diagnostic.severity) {
            case frontend::Severity::Error:
                spdlog::error("{}", log_message);
                break;
            case frontend::Severity::Warning:
                spdlog::warn("{}", log_message);
                break;
            case frontend::Severity::Note:
                spdlog::info("{}", log_message);
                break;
        }
    }
}

std::filesystem::path output_dir_of(const Options& opts)
{
    namespace fs = std::filesystem;
    if (opts.output_dir) {
        return fs::path(*opts.output_dir);
    }
    fs::path output_dir = fs::path(opts.input_files.front()).parent_path();
    if (output_dir.empty()) {
        output_dir = fs::current_path();
    }
    return output_dir;
}

}  // namespace

int run(int argc, char* argv[])
{
    auto opts = parse_command_line(argc, argv);
    if (!opts) {
        spdlog::error("Failed to parse command line: {}", opts.error());
        return 1;
    }

    if (opts->help_message) {
        fmt::print("{}", opts->help_message.value());
        return 0;
    }

    if (opts->verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    fmt::print("Kestrel {}\n", codegen::version_string());

    // Parse
    auto maybe_program = frontend::parse_program(opts->input_files);
    if (!maybe_program) {
        spdlog::error("Failed to parse program: {}", maybe_program.error());
        return 1;
    }

    // Validate
    frontend::Program& program = maybe_program.value();
    frontend::DiagnosticSink diagnostics;
    frontend::semantic::Validator validator{program, diagnostics};
    const bool valid = validator.run();

    log_diagnostics(diagnostics);
    if (!valid) {
        return 1;
    }

    spdlog::info("Parsed program with {} files", program.files.size());

    if (opts->print_ast) {
        nlohmann::json files = nlohmann::json::array();
        for (const auto& [path, file] : program.files) {
            nlohmann::json file_json;
            file_json["path"] = path;
            file_json["document"] = idl::ast::to_json(file.document);
            files.push_back(std::move(file_json));
        }

        nlohmann::json program_json;
        program_json["files"] = std::move(files);
        fmt::print("{}\n", program_json.dump(2));
    }

    if (opts->check_only || opts->print_ast) {
        return 0;
    }

    const auto output_dir = output_dir_of(*opts);

    codegen::GenerationOptions gen_opts;
    gen_opts.output_dir = output_dir;
    gen_opts.module = opts->module;
    gen_opts.package_prefix = opts->package_prefix;
    gen_opts.no_fast_api = opts->no_fast_api;
    gen_opts.copy_idl = opts->copy_idl;

    codegen::Generator generator{program, std::move(gen_opts)};
    auto units = generator.run();
    if (!units) {
        spdlog::error("Code generation failed: {}", units.error().to_string());
        return 1;
    }

    if (opts->list_outputs) {
        nlohmann::json outputs = nlohmann::json::array();
        for (const auto& unit : *units) {
            outputs.push_back({{"path", unit.path.string()}, {"size", unit.content.size()}});
        }

        nlohmann::json listing;
        listing["outputs"] = std::move(outputs);
        fmt::print("{}\n", listing.dump(2));
        return 0;
    }

    auto written = codegen::write_output_units(*units);
    if (!written) {
        spdlog::error("Failed to write generated files: {}", written.error());
        return 1;
    }

    spdlog::info("Generated {} files ({} changed) under {}", units->size(), *written,
                 std::filesystem::absolute(output_dir).string());
    return 0;
}

}  // namespace kestrel
