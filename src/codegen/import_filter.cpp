#include "codegen/import_filter.hpp"

namespace kestrel::codegen
{

bool is_filtered_import(const std::string& path, const ImportFilterPolicy& policy)
{
    if (!policy.module.empty() && path.starts_with(policy.module + "/")) {
        return true;  // own module
    }
    if (path == policy.legacy_runtime) {
        return true;
    }
    if (!policy.generator_support_prefix.empty() && path.starts_with(policy.generator_support_prefix)) {
        return true;
    }
    return path.find('.') == std::string::npos;  // standard library
}

ImportMap filter_imports(const ImportMap& imports, const ImportFilterPolicy& policy)
{
    ImportMap filtered;
    for (const auto& [path, alias] : imports) {
        if (!is_filtered_import(path, policy)) {
            filtered.emplace(path, alias);
        }
    }
    return filtered;
}

}  // namespace kestrel::codegen
