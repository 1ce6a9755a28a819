// tests/test_main.cpp
// doctest runner for fedsim_tests. Library logging is silenced unless a test turns it on.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "fedsim/log.hpp"

int main(int argc, char** argv) {
    fedsim::Logger::instance().set_level(fedsim::LogLevel::Off);

    doctest::Context ctx;
    ctx.applyCommandLine(argc, argv);
    return ctx.run();
}
