#pragma once

#include "idl/ast.hpp"

#include <functional>
#include <string>
#include <vector>

namespace kestrel::codegen
{

enum class EnvelopeRole { Request, Response };

/**
 * @brief A field named @c field_name (after unexporting) of exactly @c type_name plays @c role.
 */
struct EnvelopeRule {
    std::string field_name;
    std::string type_name;
    EnvelopeRole role;
};

/**
 * @brief {"base", "base.Base"} -> Request, {"baseResp", "base.BaseResp"} -> Response.
 */
const std::vector<EnvelopeRule>& default_envelope_rules();

struct EnvelopeMatch {
    std::vector<const idl::ast::StructLike*> requests;
    std::vector<const idl::ast::StructLike*> responses;
};

using NameNormalizer = std::function<std::string(const std::string&)>;

/**
 * @brief Records of @p document carrying request or response envelope fields.
 *
 * Records are listed in declaration order, each at most once per role.
 * Matching is by name and type name only, case-sensitive.
 */
EnvelopeMatch extract_envelopes(const idl::ast::Document& document,
                                const NameNormalizer& unexport,
                                const std::vector<EnvelopeRule>& rules = default_envelope_rules());

}  // namespace kestrel::codegen
