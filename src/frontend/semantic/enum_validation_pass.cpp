#include "enum_validation_pass.hpp"

#include "semantic_context.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

#include <unordered_map>

namespace kestrel::frontend::semantic
{

void EnumValidationPass::run(Context& context)
{
    for (const auto& [_, file] : context.program().files) {
        for (const auto& definition : file.document.definitions) {
            if (const auto* e = boost::get<ast::Enum>(&definition)) {
                const auto owner = "enum '" + e->name + "'";
                check_unique_names(context, e->values, file, owner, "enum value");

                // implicit values continue from the previous one, as in thrift
                std::unordered_map<std::int64_t, const ast::EnumValue*> seen;
                std::int64_t next = 0;
                for (const auto& value : e->values) {
                    const auto current = value.value.value_or(next);
                    auto [it, inserted] = seen.emplace(current, &value);
                    if (!inserted) {
                        context.report_warning(file, value,
                                               "Enum value '" + value.name + "' reuses value " +
                                                   std::to_string(current) + " of '" + it->second->name +
                                                   "' in " + owner);
                    }
                    next = current + 1;
                }
            }
        }
    }
}

}  // namespace kestrel::frontend::semantic
