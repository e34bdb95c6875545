#pragma once

#include "codegen/result.hpp"
#include "idl/ast.hpp"

#include <functional>
#include <string_view>

namespace kestrel::codegen
{

enum class EncodingClass { FixedWidth, VariableWidth };

/**
 * @brief Answers whether the encoded length of a type is statically known.
 */
using FixedWidthPredicate = std::function<Result<bool>(const idl::ast::Type&)>;

/**
 * @brief Encoding-width class of @p field. Errors of @p is_fixed_width are returned unchanged.
 */
Result<EncodingClass> classify_field(const idl::ast::Field& field, const FixedWidthPredicate& is_fixed_width);

std::string_view to_string(EncodingClass encoding);

}  // namespace kestrel::codegen
