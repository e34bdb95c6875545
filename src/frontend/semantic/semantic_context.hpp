#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/program.hpp"
#include "frontend/semantic/type_resolver.hpp"
#include "idl/ast.hpp"

#include <optional>
#include <string>

namespace kestrel::frontend::semantic {

namespace ast = idl::ast;

class Context
{
public:
    Context(Program& program, DiagnosticSink& sink);

    Program& program();
    const Program& program() const;

    DiagnosticSink& diagnostics();

    const TypeResolver& resolver() const;

    /**
     * @brief Resolve a type reference, reporting an error when it fails.
     *
     * @return The resolved declaration, or nothing if an error was reported.
     */
    std::optional<ResolvedType> resolve_user_type(const ast::UserType& user_type, const SourceFile& file,
                                                  const std::string& usage) const;

    void report_error(const SourceFile& file, const ast::PositionTaggedNode& node,
                      const std::string& message) const;
    void report_warning(const SourceFile& file, const ast::PositionTaggedNode& node,
                        const std::string& message) const;
    void report_note(const SourceFile& file, const ast::PositionTaggedNode& node,
                     const std::string& message) const;
private:

    void report(Severity severity, const SourceFile& file, const ast::PositionTaggedNode& node,
                const std::string& message) const;

    Program& program_;
    DiagnosticSink& sink_;
    TypeResolver resolver_;
};

}  // namespace kestrel::frontend::semantic
