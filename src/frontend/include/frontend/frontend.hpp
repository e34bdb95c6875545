#pragma once

#include "frontend/program.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace kestrel::frontend
{

/**
 * @brief Parse a program from a root IDL file.
 *
 * @param root_path Path to the root IDL file.
 * @return std::expected<Program, std::string> Parsed program or error message.
 */
std::expected<Program, std::string> parse_program(const std::string& root_path);

/**
 * @brief Parse a program from several root IDL files.
 *
 * Files shared between roots are parsed once.
 */
std::expected<Program, std::string> parse_program(const std::vector<std::string>& root_paths);

namespace detail
{

/**
 * @brief Read a file into a string.
 *
 * @param path Path to the file.
 * @return File content or error message.
 */
std::expected<std::string, std::string> read_file(const std::string& path);

std::string normalize_path(const std::filesystem::path& path);

/**
 * @brief Include alias of an include path: "a/b/base.thrift" -> "base".
 */
std::string reference_name_of(const std::string& path);

/**
 * @brief Parse a file and, recursively, all files it includes.
 *
 * Passing all_files by reference allows us to avoid copying the map and
 * check if a file has already been parsed. A file that is already present
 * is not parsed again, so include cycles terminate.
 *
 * @param path Normalized path to the file.
 * @param all_files Map of all parsed files.
 * @return Nothing or error message.
 */
std::expected<void, std::string> parse_includes(const std::string& path, Program::Files& all_files);

}  // namespace detail

}  // namespace kestrel::frontend
