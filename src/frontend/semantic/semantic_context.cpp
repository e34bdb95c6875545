#include "semantic_context.hpp"

namespace kestrel::frontend::semantic
{

Context::Context(Program& program, DiagnosticSink& sink)
    : program_(program)
    , sink_(sink)
    , resolver_(program)
{
}

Program& Context::program()
{
    return program_;
}

const Program& Context::program() const
{
    return program_;
}

DiagnosticSink& Context::diagnostics()
{
    return sink_;
}

const TypeResolver& Context::resolver() const
{
    return resolver_;
}

std::optional<ResolvedType> Context::resolve_user_type(const ast::UserType& user_type, const SourceFile& file,
                                                       const std::string& usage) const
{
    auto resolved = resolver_.resolve(user_type, file);
    if (!resolved) {
        report_error(file, user_type, resolved.error() + " referenced in " + usage);
        return std::nullopt;
    }
    return resolved.value();
}

void Context::report(Severity severity, const SourceFile& file, const ast::PositionTaggedNode& node,
                     const std::string& message) const
{
    sink_.report(severity, locate(node, file), message);
}

void Context::report_error(const SourceFile& file, const ast::PositionTaggedNode& node,
                           const std::string& message) const
{
    report(Severity::Error, file, node, message);
}

void Context::report_warning(const SourceFile& file, const ast::PositionTaggedNode& node,
                             const std::string& message) const
{
    report(Severity::Warning, file, node, message);
}

void Context::report_note(const SourceFile& file, const ast::PositionTaggedNode& node,
                          const std::string& message) const
{
    report(Severity::Note, file, node, message);
}

}  // namespace kestrel::frontend::semantic
