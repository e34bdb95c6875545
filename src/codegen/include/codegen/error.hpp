#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace kestrel::codegen
{

/**
 * @brief Failure classes of a generation run. Every one of them is fatal.
 */
enum class ErrorKind {
    ScopeResolution = 1,  ///< namespace, package or output path of a file cannot be computed
    ImportResolution,     ///< import set of a file cannot be computed
    TypeClassification,   ///< fixed-width or binary/string predicate failed
    Render,               ///< template execution failed
    SourceRead            ///< verbatim IDL copy could not be read
};

class CodegenErrorCategory : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "kestrel.codegen";
    }

    std::string message(int ev) const override
    {
        const auto kind = static_cast<ErrorKind>(ev);
        switch (kind) {
            case ErrorKind::ScopeResolution:
                return "scope resolution error";
            case ErrorKind::ImportResolution:
                return "import resolution error";
            case ErrorKind::TypeClassification:
                return "type classification error";
            case ErrorKind::Render:
                return "render error";
            case ErrorKind::SourceRead:
                return "source read error";
        }
        return "unknown";
    }
};

inline const std::error_category& codegen_error_category()
{
    static CodegenErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ErrorKind kind)
{
    return {static_cast<int>(kind), codegen_error_category()};
}

struct Error {
    std::error_code code = make_error_code(ErrorKind::Render);
    std::string message;

    Error() = default;

    Error(ErrorKind kind_, std::string message_)
        : code(make_error_code(kind_))
        , message(std::move(message_))
    {
    }

    Error(std::error_code code_, std::string message_)
        : code(std::move(code_))
        , message(std::move(message_))
    {
    }

    ErrorKind kind() const
    {
        return static_cast<ErrorKind>(code.value());
    }

    std::string to_string() const
    {
        return code.message() + ": " + message;
    }
};

inline Error make_error(ErrorKind kind, std::string message = {})
{
    return Error{kind, std::move(message)};
}

}  // namespace kestrel::codegen
