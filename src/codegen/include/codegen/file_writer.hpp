#pragma once

#include "codegen/output_unit.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kestrel::codegen
{

/**
 * @brief Write @p content to @p path unless the file already holds exactly that content.
 *
 * @return true if the file was written.
 */
std::expected<bool, std::string> write_file_if_changed(const std::filesystem::path& path, std::string_view content);

/**
 * @brief Write all units, creating their directories.
 *
 * @return Number of files actually written.
 */
std::expected<std::size_t, std::string> write_output_units(const std::vector<OutputUnit>& units);

}  // namespace kestrel::codegen
