#include "struct_validation_pass.hpp"

#include "semantic_context.hpp"
#include "type_validator.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

namespace kestrel::frontend::semantic
{

void StructValidationPass::run(Context& context)
{
    TypeValidator type_validator(context);
    for (const auto& [_, file] : context.program().files) {
        for (const auto& definition : file.document.definitions) {
            if (const auto* s = boost::get<ast::StructLike>(&definition)) {
                const auto owner = ast::to_string(s->kind) + " '" + s->name + "'";
                check_unique_names(context, s->fields, file, owner, "field");
                check_id_collection(context, s->fields, file, owner, "field");
                for (const auto& field : s->fields) {
                    type_validator.validate(field.type, file, field,
                                            "field '" + field.name + "' of " + owner);
                    if (s->kind == ast::StructKind::Union && field.requiredness == ast::Requiredness::Required) {
                        context.report_error(file, field,
                                             "Union field '" + field.name + "' of " + owner +
                                                 " cannot be required");
                    }
                }
            } else if (const auto* t = boost::get<ast::Typedef>(&definition)) {
                type_validator.validate(t->type, file, *t, "typedef '" + t->name + "'");
            }
        }
    }
}

}  // namespace kestrel::frontend::semantic
