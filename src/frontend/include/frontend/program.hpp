#pragma once

#include <map>
#include <string>
#include <vector>

#include "source_file.hpp"

namespace kestrel::frontend {

struct Program {
    using Files = std::map<std::string, SourceFile>;
    Files files;
    std::vector<std::string> roots;  ///< Paths of the files given on the command line

    const SourceFile* find(const std::string& path) const;

    /**
     * @brief Pre-order depth-first walk over the include forest.
     *
     * Starts from each root in order and follows includes in declaration
     * order. Every file is yielded exactly once, however many files include it.
     */
    std::vector<const SourceFile*> depth_first() const;
};

} // namespace kestrel::frontend
