#pragma once

#include <map>
#include <string>

namespace kestrel::codegen
{

/**
 * @brief Import path -> local alias. An empty alias means the package name is used.
 */
using ImportMap = std::map<std::string, std::string>;

inline constexpr const char* kLegacyThriftRuntime = "github.com/apache/thrift/lib/go/thrift";
inline constexpr const char* kGeneratorSupportPrefix = "github.com/cloudwego/thriftgo";

struct ImportFilterPolicy {
    std::string module;  ///< own module root; paths below it are dropped. Empty disables the rule.
    std::string legacy_runtime = kLegacyThriftRuntime;
    std::string generator_support_prefix = kGeneratorSupportPrefix;
};

/**
 * @brief True if @p path must not appear in the import block of a generated file.
 */
bool is_filtered_import(const std::string& path, const ImportFilterPolicy& policy);

/**
 * @brief Copy of @p imports without the entries rejected by is_filtered_import().
 */
ImportMap filter_imports(const ImportMap& imports, const ImportFilterPolicy& policy);

}  // namespace kestrel::codegen
