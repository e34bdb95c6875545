#pragma once

#include "semantic_pass.hpp"

namespace kestrel::frontend::semantic
{

class ServiceValidationPass : public Pass
{
public:
    std::string name() const override
    {
        return "service-validation";
    }

    void run(Context& context) override;
};

}  // namespace kestrel::frontend::semantic
