#include "service_validation_pass.hpp"

#include "semantic_context.hpp"
#include "type_validator.hpp"
#include "utility.hpp"

#include <boost/variant/get.hpp>

namespace kestrel::frontend::semantic
{

namespace
{

bool is_exception(const ResolvedType& resolved)
{
    const auto* s = boost::get<ast::StructLike>(resolved.definition);
    return s != nullptr && s->kind == ast::StructKind::Exception;
}

void validate_extends(Context& context, const ast::Service& service, const SourceFile& file)
{
    if (!service.extends) {
        return;
    }
    const auto& base = *service.extends;
    const SourceFile* target = &file;
    if (base.parts.size() == 2) {
        const auto* include = file.find_include(base.parts.front());
        target = include ? context.program().find(include->path) : nullptr;
    } else if (base.parts.size() != 1) {
        target = nullptr;
    }
    const ast::Definition* definition =
        target ? context.resolver().find(*target, base.parts.back()) : nullptr;
    if (definition == nullptr || boost::get<ast::Service>(definition) == nullptr) {
        context.report_error(file, service,
                             "Service '" + service.name + "' extends unknown service '" + base.to_string() + "'");
    }
}

}  // namespace

void ServiceValidationPass::run(Context& context)
{
    TypeValidator type_validator(context);
    for (const auto& [_, file] : context.program().files) {
        for (const auto& definition : file.document.definitions) {
            const auto* service = boost::get<ast::Service>(&definition);
            if (service == nullptr) {
                continue;
            }

            const auto service_owner = "service '" + service->name + "'";
            check_unique_names(context, service->functions, file, service_owner, "function");
            validate_extends(context, *service, file);

            for (const auto& function : service->functions) {
                const auto function_owner = "function '" + function.name + "'";
                check_unique_names(context, function.arguments, file, function_owner, "argument");
                check_id_collection(context, function.arguments, file, function_owner, "argument");
                for (const auto& argument : function.arguments) {
                    type_validator.validate(argument.type, file, argument,
                                            "argument '" + argument.name + "' of " + function_owner);
                }

                check_unique_names(context, function.throws, file, function_owner + " throws", "exception");
                check_id_collection(context, function.throws, file, function_owner + " throws", "exception");
                for (const auto& thrown : function.throws) {
                    const auto* user = boost::get<ast::UserType>(&thrown.type);
                    if (user == nullptr) {
                        context.report_error(file, thrown,
                                             "Non-exception type thrown by " + function_owner);
                        continue;
                    }
                    auto resolved = context.resolve_user_type(*user, file, "throws of " + function_owner);
                    if (resolved && !is_exception(*resolved)) {
                        context.report_error(file, thrown,
                                             "'" + user->name.to_string() + "' thrown by " + function_owner +
                                                 " is not an exception");
                    }
                }

                if (!function.result.is_void) {
                    type_validator.validate(function.result.type, file, function, "result of " + function_owner);
                }

                if (function.oneway && (!function.result.is_void || !function.throws.empty())) {
                    context.report_error(file, function,
                                         "Oneway " + function_owner + " must return void and throw nothing");
                }
            }
        }
    }
}

}  // namespace kestrel::frontend::semantic
