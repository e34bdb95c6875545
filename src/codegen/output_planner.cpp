#include "codegen/output_planner.hpp"

#include <fmt/format.h>

#include <utility>

namespace kestrel::codegen
{

std::string protection_content(std::string_view package)
{
    return fmt::format("package {}\n\n"
                       "// {} is used to prevent 'imported and not used' error.\n"
                       "var {} = struct{{}}{{}}\n",
                       package, kProtectionSymbol, kProtectionSymbol);
}

OutputPlanner::OutputPlanner(std::string output_prefix, std::string protection_file)
    : _output_prefix(std::move(output_prefix))
    , _protection_file(std::move(protection_file))
{
}

OutputPlan OutputPlanner::plan(const std::filesystem::path& resolved_path) const
{
    OutputPlan plan;
    plan.directory = resolved_path.parent_path();
    plan.protection = plan.directory / _protection_file;

    auto target_name = _output_prefix + resolved_path.filename().string();
    if (target_name == _protection_file) {
        // consts.thrift: the protection file keeps the name, the document's unit moves aside
        target_name = _output_prefix + resolved_path.stem().string() + "_" + resolved_path.extension().string();
    }
    plan.target = plan.directory / target_name;
    return plan;
}

std::optional<OutputUnit> OutputPlanner::claim_protection(const OutputPlan& plan, std::string_view package)
{
    if (!_protected.insert(plan.directory.lexically_normal().string()).second) {
        return std::nullopt;
    }
    return OutputUnit{plan.protection, protection_content(package)};
}

}  // namespace kestrel::codegen
