#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "spdlog/spdlog.h"

int main(int argc, char **argv)
{
    // library code logs at debug level; keep test output to failures
    spdlog::set_level(spdlog::level::warn);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
