#include "frontend/diagnostic.hpp"

#include <algorithm>
#include <tuple>

namespace kestrel::frontend
{

std::string to_string(Severity severity)
{
    switch (severity) {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "unknown";
}

std::string format(const Diagnostic& diagnostic)
{
    const auto& loc = diagnostic.location;
    return loc.file + ":" + std::to_string(loc.line) + ":" + std::to_string(loc.column) + ": " + diagnostic.message;
}

void DiagnosticSink::report(Severity severity, SourceLocation location, std::string message)
{
    ++_counts[static_cast<std::size_t>(severity)];
    _diagnostics.push_back(Diagnostic{severity, std::move(location), std::move(message)});
}

std::size_t DiagnosticSink::count(Severity severity) const
{
    return _counts[static_cast<std::size_t>(severity)];
}

bool DiagnosticSink::has_errors() const
{
    return count(Severity::Error) > 0;
}

bool DiagnosticSink::has_warnings() const
{
    return count(Severity::Warning) > 0;
}

const std::vector<Diagnostic>& DiagnosticSink::diagnostics() const
{
    return _diagnostics;
}

std::vector<Diagnostic> DiagnosticSink::sorted() const
{
    auto result = _diagnostics;
    std::stable_sort(result.begin(), result.end(), [](const Diagnostic& lhs, const Diagnostic& rhs) {
        return std::tie(lhs.location.file, lhs.location.line, lhs.location.column) <
               std::tie(rhs.location.file, rhs.location.line, rhs.location.column);
    });
    return result;
}

}  // namespace kestrel::frontend
