#pragma once

#include <fmt/core.h>

#include <string>

namespace kestrel::codegen
{

inline std::string version_string()
{
    return fmt::format("v{}.{}.{}", KESTREL_VERSION_MAJOR, KESTREL_VERSION_MINOR, KESTREL_VERSION_PATCH);
}

}  // namespace kestrel::codegen
