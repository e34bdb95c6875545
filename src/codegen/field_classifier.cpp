#include "codegen/field_classifier.hpp"

#include <utility>

namespace kestrel::codegen
{

Result<EncodingClass> classify_field(const idl::ast::Field& field, const FixedWidthPredicate& is_fixed_width)
{
    auto fixed = is_fixed_width(field.type);
    if (!fixed) {
        return std::unexpected(std::move(fixed).error());
    }
    return *fixed ? EncodingClass::FixedWidth : EncodingClass::VariableWidth;
}

std::string_view to_string(EncodingClass encoding)
{
    switch (encoding) {
        case EncodingClass::FixedWidth:
            return "fixed-width";
        case EncodingClass::VariableWidth:
            return "variable-width";
    }
    return "unknown";
}

}  // namespace kestrel::codegen
