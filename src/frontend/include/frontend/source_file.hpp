#pragma once

#include "idl/ast.hpp"
#include "idl/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kestrel::frontend
{

struct ResolvedInclude {
    std::string alias;  ///< Name used to qualify types of the included file, e.g. "base" for base.thrift
    std::string path;   ///< Key of the included file in Program::files
};

struct SourceFile {
    std::string path;                                                ///< Normalized path to the file
    std::string content;                                             ///< Whole content of the file
    idl::ast::Document document;                                     ///< Parsed AST of the file
    std::optional<idl::parser::position_cache_type> position_cache;  ///< Positions into content
    std::vector<ResolvedInclude> includes;                           ///< In declaration order

    /**
     * @brief Base name of the file without extension.
     */
    std::string reference_name() const;

    const ResolvedInclude* find_include(const std::string& alias) const;
};

}  // namespace kestrel::frontend
