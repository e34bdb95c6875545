#pragma once

#include <filesystem>
#include <string>

namespace kestrel::codegen
{

/**
 * @brief One generated artifact: a file path and its full content.
 */
struct OutputUnit {
    std::filesystem::path path;
    std::string content;
};

}  // namespace kestrel::codegen
