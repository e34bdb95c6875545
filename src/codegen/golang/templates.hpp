#pragma once

#include "codegen/template_set.hpp"

namespace kestrel::codegen::golang
{

/**
 * @brief Templates of the fast-codec companion file. The entry template is "file".
 */
TemplateSet build_templates();

}  // namespace kestrel::codegen::golang
