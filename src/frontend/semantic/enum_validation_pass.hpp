#pragma once

#include "semantic_pass.hpp"

namespace kestrel::frontend::semantic
{

class EnumValidationPass : public Pass
{
public:
    std::string name() const override
    {
        return "enum-validation";
    }

    void run(Context& context) override;
};

}  // namespace kestrel::frontend::semantic
