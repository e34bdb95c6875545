#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace kestrel
{
/**
 * @brief Command line options
 */
struct Options {
    std::vector<std::string> input_files;     ///< root IDL files; includes are resolved relative to each file
    std::optional<std::string> output_dir;    ///< if not specified, use the directory of the first input file
    std::optional<std::string> help_message;  ///< if specified, show help message
    std::string module;                       ///< Go module of the generated code
    std::string package_prefix;               ///< import path prefix of generated packages, defaults to module
    bool no_fast_api = false;                 ///< if true, do not generate FastRead/FastWrite/BLength
    bool copy_idl = false;                    ///< if true, copy the IDL files next to the generated ones
    bool check_only = false;                  ///< if true, only check the input files for errors
    bool print_ast = false;                   ///< if true, print the AST to stdout as JSON
    bool list_outputs = false;                ///< if true, print the output units as JSON instead of writing them
    bool verbose = false;                     ///< if true, enable debug logging
};

/**
 * @brief Parse command line options
 *
 * @param argc Number of command line arguments
 * @param argv Command line arguments
 * @return Parsed options or error message
 */
std::expected<Options, std::string> parse_command_line(int argc, char* argv[]);

}  // namespace kestrel
