#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "ifc2lbd/logging.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Suppress logs during tests unless explicitly needed
    ifc2lbd::set_log_level(ifc2lbd::LogLevel::ERROR);
    spdlog::set_level(spdlog::level::err);

    return RUN_ALL_TESTS();
}
