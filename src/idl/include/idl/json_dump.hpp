#pragma once

#include "idl/ast.hpp"

#include <nlohmann/json_fwd.hpp>

namespace kestrel::idl::ast
{

/**
 * @brief Produce a JSON representation of a parsed IDL document.
 *
 * This is primarily intended for diagnostics / debugging output where the
 * complete parse tree is required (e.g., --print-ast CLI flag).
 */
nlohmann::json to_json(const Document& document);

}  // namespace kestrel::idl::ast
