#pragma once

#include "codegen/options.hpp"
#include "codegen/output_unit.hpp"
#include "codegen/result.hpp"
#include "frontend/program.hpp"

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace kestrel::codegen
{

class OutputPlanner;
class TemplateSet;
struct FuncMap;

namespace golang
{
class CodeUtils;
}

/**
 * @brief Produces the output units of a program.
 *
 * Files are visited once each, depth-first from the roots. The first error
 * ends the run and no units are returned.
 */
class Generator
{
public:
    using SourceReader = std::function<std::expected<std::string, std::string>(const std::string&)>;

    Generator(const frontend::Program& program, GenerationOptions options, SourceReader reader = {});

    Result<std::vector<OutputUnit>> run() const;

private:
    /// State of one run
    struct Run {
        golang::CodeUtils& utils;
        const TemplateSet& templates;
        const FuncMap& funcs;
        OutputPlanner& planner;
        std::vector<OutputUnit>& units;
    };

    FuncMap build_func_map(const golang::CodeUtils& utils) const;
    Result<void> generate_file(const frontend::SourceFile& file, Run& run) const;
    Result<void> append(OutputUnit unit, std::vector<OutputUnit>& units) const;

    const frontend::Program& _program;
    GenerationOptions _options;
    SourceReader _reader;
};

}  // namespace kestrel::codegen
