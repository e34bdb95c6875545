#include "frontend/frontend.hpp"

#include "idl/parser.hpp"

#include <expected>
#include <filesystem>
#include <fstream>

namespace kestrel::frontend
{

std::expected<Program, std::string> parse_program(const std::string& root_path)
{
    return parse_program(std::vector<std::string>{root_path});
}

std::expected<Program, std::string> parse_program(const std::vector<std::string>& root_paths)
{
    if (root_paths.empty()) {
        return std::unexpected("No input files");
    }

    Program program;
    for (const auto& root_path : root_paths) {
        auto root = detail::normalize_path(root_path);
        auto maybe = detail::parse_includes(root, program.files);
        if (!maybe) {
            return std::unexpected(maybe.error());
        }
        program.roots.push_back(std::move(root));
    }
    return program;
}

namespace detail
{

std::expected<std::string, std::string> read_file(const std::string& path)
{
    namespace fs = std::filesystem;

    const fs::path fs_path(path);

    std::error_code ec;
    if (!fs::is_regular_file(fs_path, ec) || ec) {
        return std::unexpected("Failed to open file: " + fs_path.string() + ": " +
                               (ec ? ec.message() : std::string("not a regular file")));
    }

    std::ifstream file(fs_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected("Failed to open file: " + fs_path.string());
    }

    const auto file_size = fs::file_size(fs_path, ec);
    if (ec) {
        return std::unexpected("Failed to read file: " + fs_path.string() + ": " + ec.message());
    }

    std::string content(file_size, '\0');
    if (!file.read(content.data(), static_cast<std::streamsize>(content.size()))) {
        return std::unexpected("Failed to read file: " + fs_path.string());
    }

    return content;
}

std::string normalize_path(const std::filesystem::path& path)
{
    return path.lexically_normal().string();
}

std::string reference_name_of(const std::string& path)
{
    return std::filesystem::path(path).stem().string();
}

std::expected<void, std::string> parse_includes(const std::string& path, Program::Files& all_files)
{
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto [iterator, inserted] = all_files.try_emplace(path);
    if (!inserted) {
        return {};
    }

    // The position cache points into the content, so the content is placed
    // into its final home before parsing.
    SourceFile& file = iterator->second;
    file.path = path;
    file.content = std::move(content.value());

    auto parsed = idl::parser::parse_file(file.content, path);
    if (!parsed) {
        return std::unexpected("Failed to parse " + path + ": " + parsed.error());
    }
    file.document = std::move(parsed->document);
    file.position_cache.emplace(std::move(parsed->position_cache));

    // Include paths are relative to the including file.
    namespace fs = std::filesystem;
    fs::path base_dir = fs::path(path).parent_path();

    for (const auto* include : idl::ast::includes_of(file.document)) {
        auto include_path = normalize_path(base_dir / include->path);
        auto alias = reference_name_of(include->path);
        if (const auto* existing = file.find_include(alias); existing && existing->path != include_path) {
            return std::unexpected("Ambiguous include '" + alias + "' in " + path + ": both " + existing->path +
                                   " and " + include_path);
        }
        file.includes.push_back(ResolvedInclude{alias, include_path});

        if (!all_files.contains(include_path)) {
            auto maybe = parse_includes(include_path, all_files);
            if (!maybe) {
                return std::unexpected(maybe.error());
            }
        }
    }

    return {};
}

}  // namespace detail

}  // namespace kestrel::frontend
