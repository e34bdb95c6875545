#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/program.hpp"

#include <memory>
#include <string>
#include <vector>

namespace kestrel::frontend::semantic
{

class Pass;

/**
 * @brief Runs the semantic passes over a loaded program.
 *
 * Passes run in a fixed order: declaration indexing first, so that the struct,
 * enum and service checks can resolve user types across includes.
 */
class Validator
{
public:
    Validator(Program& program, DiagnosticSink& sink);
    ~Validator();

    std::vector<std::string> pass_names() const;

    /// Returns false when any pass reported an error.
    bool run();

private:
    Program& program_;
    DiagnosticSink& sink_;
    std::vector<std::unique_ptr<Pass>> passes_;
};

}  // namespace kestrel::frontend::semantic
