#pragma once

#include "codegen/version.hpp"

#include <filesystem>
#include <string>

namespace kestrel::codegen
{

/**
 * @brief Run-wide settings of a generation run.
 */
struct GenerationOptions {
    std::filesystem::path output_dir;            ///< root of all output paths
    std::string module;                          ///< Go module of the generated code, may be empty
    std::string package_prefix;                  ///< import path prefix of generated packages; module if empty
    bool no_fast_api = false;                    ///< skip FastRead/FastWrite/BLength
    bool copy_idl = false;                       ///< also emit the IDL sources next to the generated files
    std::string output_prefix = "k-";            ///< prepended to the base name of every generated file
    std::string protection_file = "k-consts.go"; ///< per-directory file holding the protection symbol
    std::string version = version_string();
};

}  // namespace kestrel::codegen
