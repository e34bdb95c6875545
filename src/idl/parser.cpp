#include "idl/parser.hpp"

#include "idl/rules.hpp"

#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>

#include <expected>
#include <sstream>

namespace kestrel::idl::parser
{

std::expected<ParseResult, std::string> parse_file(const std::string& input, const std::string& filename)
{
    auto iter = input.begin();
    auto end = input.end();

    std::ostringstream diag_stream;

    // error handling; the handler also owns the position cache filled by annotate_on_success
    error_context_type err_handler(iter, end, diag_stream, filename);

    // clang-format off
    const auto parser =
        x3::with<x3::error_handler_tag>(std::ref(err_handler))[
            document()
        ];
    // clang-format on

    ast::Document d;
    bool ok = x3::phrase_parse(iter, end, parser, skipper(), d);

    if (!ok || iter != end) {
        auto diagnostic = diag_stream.str();
        if (!diagnostic.empty()) {
            return std::unexpected(diagnostic);
        } else {
            std::string result = "Parse error near: ";
            auto rem = std::string(iter, end);
            if (rem.size() > 64)
                rem.resize(64);
            result += rem;
            return std::unexpected(result);
        }
    }

    return ParseResult{
        .document = std::move(d),
        .position_cache = err_handler.get_position_cache()
    };
}

}  // namespace kestrel::idl::parser
