#pragma once

#include "frontend/source_file.hpp"

#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace kestrel::frontend
{

enum class Severity {
    Note,
    Warning,
    Error,
};

std::string to_string(Severity severity);

struct SourceLocation {
    std::string file;
    std::size_t line = 0;  ///< 1-based, 0 when the node carries no position
    std::size_t column = 0;
};

struct Diagnostic {
    Severity severity;
    SourceLocation location;
    std::string message;
};

/**
 * @brief Render a diagnostic as "file:line:column: message".
 */
std::string format(const Diagnostic& diagnostic);

/**
 * @brief Collects the findings of the semantic passes over a program.
 *
 * Diagnostics are kept in reporting order; per-severity counters make the
 * error and warning checks constant time.
 */
class DiagnosticSink
{
public:
    void report(Severity severity, SourceLocation location, std::string message);

    std::size_t count(Severity severity) const;
    bool has_errors() const;
    bool has_warnings() const;

    const std::vector<Diagnostic>& diagnostics() const;

    /// Diagnostics ordered by file, line and column. Reporting order breaks ties.
    std::vector<Diagnostic> sorted() const;

private:
    std::vector<Diagnostic> _diagnostics;
    std::array<std::size_t, 3> _counts{};
};

/**
 * @brief Compute the line and column of an AST node from the position cache of its file.
 *
 * Nodes that are not position tagged, or that were never annotated by the parser,
 * are located at line 0 of the file.
 */
template <typename Node>
SourceLocation locate(const Node& node, const SourceFile& file)
{
    using boost::spirit::x3::position_tagged;

    if constexpr (std::is_base_of_v<position_tagged, Node>) {
        const auto& tagged = static_cast<const position_tagged&>(node);
        if (!file.position_cache || tagged.id_first < 0 || tagged.id_last < 0) {
            return {file.path, 0, 0};
        }

        const auto range = file.position_cache->position_of(tagged);
        std::size_t line = 1;
        std::size_t column = 1;
        for (auto it = file.position_cache->first(); it != range.begin(); ++it) {
            if (*it == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        return {file.path, line, column};
    } else {
        return {file.path, 0, 0};
    }
}

}  // namespace kestrel::frontend
