#include <gtest/gtest.h>
#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    core::logging::initializeConsole(spdlog::level::warn);
    return RUN_ALL_TESTS();
}
