#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "autoarray/VirtualMemory.hpp"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::debug);
    SPDLOG_INFO("autoarray unittests, system page size {} bytes", autoarray::VirtualMemory::system()->pageSize());

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
