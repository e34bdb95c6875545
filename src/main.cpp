#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "cli/kestrel.hpp"

int main(int argc, char* argv[])
{
    try {
        return kestrel::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
