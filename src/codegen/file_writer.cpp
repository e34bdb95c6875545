#include "codegen/file_writer.hpp"

#include <fstream>
#include <iterator>

namespace kestrel::codegen
{

std::expected<bool, std::string> write_file_if_changed(const std::filesystem::path& path, std::string_view content)
{
    std::string existing;
    if (std::filesystem::exists(path)) {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) {
            return std::unexpected("Failed to read existing file '" + path.string() + "'");
        }
        existing.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    if (existing == content) {
        return false;
    }

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected("Failed to write file '" + path.string() + "'");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected("Failed to write file '" + path.string() + "'");
    }
    return true;
}

std::expected<std::size_t, std::string> write_output_units(const std::vector<OutputUnit>& units)
{
    std::size_t written = 0;
    for (const auto& unit : units) {
        if (unit.path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(unit.path.parent_path(), ec);
            if (ec) {
                return std::unexpected("Failed to create directory '" + unit.path.parent_path().string() +
                                       "': " + ec.message());
            }
        }

        auto result = write_file_if_changed(unit.path, unit.content);
        if (!result) {
            return std::unexpected(result.error());
        }
        written += *result ? 1 : 0;
    }
    return written;
}

}  // namespace kestrel::codegen
