#pragma once

#include "codegen/output_unit.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace kestrel::codegen
{

/**
 * @brief Symbol every generated package defines once, so imports of it are always used.
 */
inline constexpr std::string_view kProtectionSymbol = "KestrelUnusedProtection";

/**
 * @brief Content of the protection file of package @p package.
 */
std::string protection_content(std::string_view package);

struct OutputPlan {
    std::filesystem::path directory;   ///< directory of the resolved output path
    std::filesystem::path target;      ///< <directory>/<prefix><base name>, or <prefix><stem>_<ext> if that is the protection file
    std::filesystem::path protection;  ///< <directory>/<protection file>
};

/**
 * @brief Names the output files of a run and hands out one protection unit per directory.
 *
 * One planner is used for one run only.
 */
class OutputPlanner
{
public:
    OutputPlanner(std::string output_prefix, std::string protection_file);

    OutputPlan plan(const std::filesystem::path& resolved_path) const;

    /**
     * @brief Protection unit of the plan's directory, the first time the directory is seen.
     *
     * @return The unit to append before the document's own unit, or nothing
     *         if the directory already has one.
     */
    std::optional<OutputUnit> claim_protection(const OutputPlan& plan, std::string_view package);

private:
    std::string _output_prefix;
    std::string _protection_file;
    std::unordered_set<std::string> _protected;
};

}  // namespace kestrel::codegen
