#pragma once

#include "semantic_pass.hpp"

namespace kestrel::frontend::semantic
{

class DeclarationIndexPass : public Pass
{
public:
    std::string name() const override
    {
        return "declaration-index";
    }

    void run(Context& context) override;
};

}  // namespace kestrel::frontend::semantic
