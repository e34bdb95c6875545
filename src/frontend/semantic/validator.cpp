#include "frontend/semantic/validator.hpp"

#include "declaration_index_pass.hpp"
#include "enum_validation_pass.hpp"
#include "semantic_context.hpp"
#include "service_validation_pass.hpp"
#include "struct_validation_pass.hpp"

namespace kestrel::frontend::semantic
{

Validator::Validator(Program& program, DiagnosticSink& sink)
    : program_(program)
    , sink_(sink)
{
    passes_.push_back(std::make_unique<DeclarationIndexPass>());
    passes_.push_back(std::make_unique<EnumValidationPass>());
    passes_.push_back(std::make_unique<StructValidationPass>());
    passes_.push_back(std::make_unique<ServiceValidationPass>());
}

Validator::~Validator() = default;

std::vector<std::string> Validator::pass_names() const
{
    std::vector<std::string> names;
    names.reserve(passes_.size());
    for (const auto& pass : passes_) {
        names.push_back(pass->name());
    }
    return names;
}

bool Validator::run()
{
    Context context{program_, sink_};
    for (const auto& pass : passes_) {
        pass->run(context);
    }
    return !sink_.has_errors();
}

}  // namespace kestrel::frontend::semantic
