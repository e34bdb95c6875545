#include "codegen/generator.hpp"

#include "codegen/envelope_extractor.hpp"
#include "codegen/field_reorderer.hpp"
#include "codegen/golang/code_utils.hpp"
#include "codegen/import_filter.hpp"
#include "codegen/output_planner.hpp"
#include "codegen/template_set.hpp"
#include "frontend/frontend.hpp"
#include "golang/templates.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace kestrel::codegen
{

namespace
{

/**
 * @brief Prefix the message of @p error with @p context, which names the file being generated.
 */
Error with_file(Error error, const std::string& context)
{
    error.message = context + ": " + error.message;
    return error;
}

}  // namespace

Generator::Generator(const frontend::Program& program, GenerationOptions options, SourceReader reader)
    : _program(program)
    , _options(std::move(options))
    , _reader(reader ? std::move(reader) : SourceReader(frontend::detail::read_file))
{
}

Result<std::vector<OutputUnit>> Generator::run() const
{
    golang::CodeUtils utils{_program, _options.package_prefix.empty() ? _options.module : _options.package_prefix};
    const auto templates = golang::build_templates();
    const auto funcs = build_func_map(utils);
    OutputPlanner planner{_options.output_prefix, _options.protection_file};

    std::vector<OutputUnit> units;
    Run run{utils, templates, funcs, planner, units};

    for (const auto* file : _program.depth_first()) {
        if (auto generated = generate_file(*file, run); !generated) {
            return std::unexpected(generated.error());
        }
    }

    spdlog::debug("Generated {} output units", units.size());
    return units;
}

FuncMap Generator::build_func_map(const golang::CodeUtils& utils) const
{
    FuncMap funcs;
    const auto is_fixed_width = [&utils](const idl::ast::Type& type) {
        return utils.is_fixed_length_type(type);
    };

    funcs.reorder_struct_fields = [is_fixed_width](const std::vector<idl::ast::Field>& fields) {
        return reorder_fields(fields, is_fixed_width);
    };
    funcs.type_id_to_go_type = [](const std::string& type_id) {
        return type_id_to_go_type(type_id);
    };
    funcs.filter_base = [](const idl::ast::Document& document) {
        return extract_envelopes(document, golang::unexport);
    };
    funcs.is_binary_or_string_type = [&utils](const idl::ast::Type& type) -> Result<bool> {
        auto binary = utils.is_binary_type(type);
        if (!binary || *binary) {
            return binary;
        }
        return utils.is_string_type(type);
    };
    funcs.to_package_names = [](const ImportMap& imports) {
        return to_package_names(imports);
    };
    funcs.version = [version = _options.version] {
        return version;
    };
    funcs.generate_fast_apis = [enabled = !_options.no_fast_api] {
        return enabled;
    };
    funcs.go_name = [](const std::string& name) {
        return golang::export_name(name);
    };
    funcs.wire_type = [&utils](const idl::ast::Type& type) {
        return utils.wire_type(type);
    };
    return funcs;
}

Result<void> Generator::generate_file(const frontend::SourceFile& file, Run& run) const
{
    spdlog::debug("Generating {}", file.path);

    auto scope = run.utils.build_scope(file);
    if (!scope) {
        return unexpected_result(with_file(scope.error(), "build scope for " + file.path));
    }
    run.utils.set_root_scope(*scope);

    auto path = run.utils.get_file_path(file);
    if (!path) {
        return unexpected_result(with_file(path.error(), file.path));
    }

    const auto plan = run.planner.plan(_options.output_dir / *path);
    if (auto protection = run.planner.claim_protection(plan, scope->package)) {
        spdlog::debug("Protection file {} for package {}", protection->path.string(), scope->package);
        if (auto appended = append(std::move(*protection), run.units); !appended) {
            return unexpected_result(with_file(appended.error(), file.path));
        }
    }

    auto imports = run.utils.resolve_imports();
    if (!imports) {
        return unexpected_result(with_file(imports.error(), "resolve imports for " + file.path));
    }

    FileData data;
    data.ast = &file;
    data.package = scope->package;
    data.imports = filter_imports(*imports, ImportFilterPolicy{.module = _options.module});
    spdlog::debug("{}: package {}, {} of {} imports kept", file.path, data.package, data.imports.size(),
                  imports->size());

    std::ostringstream out;
    RenderContext context;
    context.data = &data;
    context.funcs = &run.funcs;
    context.templates = &run.templates;
    if (auto rendered = run.templates.execute("file", context, out); !rendered) {
        return unexpected_result(with_file(rendered.error(), file.path));
    }

    if (auto appended = append(OutputUnit{plan.target, out.str()}, run.units); !appended) {
        return unexpected_result(with_file(appended.error(), file.path));
    }

    if (_options.copy_idl) {
        auto content = _reader(file.path);
        if (!content) {
            return unexpected_result(ErrorKind::SourceRead, fmt::format("read {}: {}", file.path, content.error()));
        }
        const auto copy = plan.directory / std::filesystem::path(file.path).filename();
        if (auto appended = append(OutputUnit{copy, std::move(*content)}, run.units); !appended) {
            return unexpected_result(with_file(appended.error(), file.path));
        }
    }
    return {};
}

Result<void> Generator::append(OutputUnit unit, std::vector<OutputUnit>& units) const
{
    const auto taken = std::any_of(units.begin(), units.end(), [&unit](const OutputUnit& existing) {
        return existing.path == unit.path;
    });
    if (taken) {
        return unexpected_result(ErrorKind::ScopeResolution,
                                 "output path " + unit.path.string() + " is already generated");
    }
    units.push_back(std::move(unit));
    return {};
}

}  // namespace kestrel::codegen
