#include "codegen/field_reorderer.hpp"

#include <algorithm>
#include <unordered_map>

namespace kestrel::codegen
{

Result<std::vector<const idl::ast::Field*>> reorder_fields(const std::vector<idl::ast::Field>& fields,
                                                           const FixedWidthPredicate& is_fixed_width)
{
    std::unordered_map<const idl::ast::Field*, EncodingClass> classes;
    classes.reserve(fields.size());

    std::vector<const idl::ast::Field*> ordered;
    ordered.reserve(fields.size());

    for (const auto& field : fields) {
        auto encoding = classify_field(field, is_fixed_width);
        if (!encoding) {
            return std::unexpected(std::move(encoding.error()));
        }
        classes.emplace(&field, *encoding);
        ordered.push_back(&field);
    }

    std::stable_partition(ordered.begin(), ordered.end(), [&classes](const idl::ast::Field* field) {
        return classes.at(field) == EncodingClass::FixedWidth;
    });
    return ordered;
}

}  // namespace kestrel::codegen
