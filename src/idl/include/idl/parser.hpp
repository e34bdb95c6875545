#pragma once

#include "ast.hpp"
#include "idl/config.hpp"

#include <expected>
#include <string>

namespace kestrel::idl::parser
{

struct ParseResult {
    ast::Document document;
    position_cache_type position_cache;
};

/**
 * @brief Parse one IDL buffer.
 *
 * The position cache refers into @p input, so the buffer must outlive the
 * result and must not be moved while the cache is in use.
 *
 * @param input IDL source text.
 * @param filename Name used in error messages.
 * @return Parsed document or error message.
 */
std::expected<ParseResult, std::string> parse_file(const std::string& input, const std::string& filename = {});

}  // namespace kestrel::idl::parser
