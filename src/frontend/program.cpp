#include "frontend/program.hpp"

#include "frontend/frontend.hpp"

#include <functional>
#include <unordered_set>

namespace kestrel::frontend
{

std::string SourceFile::reference_name() const
{
    return detail::reference_name_of(path);
}

const ResolvedInclude* SourceFile::find_include(const std::string& alias) const
{
    for (const auto& include : includes) {
        if (include.alias == alias) {
            return &include;
        }
    }
    return nullptr;
}

const SourceFile* Program::find(const std::string& path) const
{
    auto it = files.find(path);
    return it == files.end() ? nullptr : &it->second;
}

std::vector<const SourceFile*> Program::depth_first() const
{
    std::vector<const SourceFile*> order;
    std::unordered_set<const SourceFile*> visited;

    std::function<void(const SourceFile*)> visit = [&](const SourceFile* file) {
        if (file == nullptr || !visited.insert(file).second) {
            return;
        }
        order.push_back(file);
        for (const auto& include : file->includes) {
            visit(find(include.path));
        }
    };

    for (const auto& root : roots) {
        visit(find(root));
    }
    return order;
}

}  // namespace kestrel::frontend
