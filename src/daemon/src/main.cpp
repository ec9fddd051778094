/*
 * GPU Fan Control — Entry point (main)
 * (c) 2025 GpuFanControl contributors
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "include/Cli.hpp"
#include "include/Log.hpp"
#include "include/NvmlBackend.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0u);
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    gfc::CliContext ctx{
        [](gfc::Logger& log) -> std::unique_ptr<gfc::FanBackend> {
            return std::make_unique<gfc::NvmlBackend>(log);
        },
        std::cout,
        std::cerr
    };

    return gfc::runCli(args, ctx);
}
