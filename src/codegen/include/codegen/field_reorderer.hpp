#pragma once

#include "codegen/field_classifier.hpp"
#include "codegen/result.hpp"
#include "idl/ast.hpp"

#include <vector>

namespace kestrel::codegen
{

/**
 * @brief Stable partition of a record's fields: fixed-width fields first, then variable-width ones.
 *
 * Both groups keep their declaration order. If any field cannot be classified
 * the error is returned and no partial order is produced.
 *
 * @param fields Fields of one record, in declaration order.
 * @param is_fixed_width Fixed-width predicate used to classify each field.
 * @return Pointers into @p fields in encoding order.
 */
Result<std::vector<const idl::ast::Field*>> reorder_fields(const std::vector<idl::ast::Field>& fields,
                                                           const FixedWidthPredicate& is_fixed_width);

}  // namespace kestrel::codegen
