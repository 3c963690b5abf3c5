// Test main for the halbox suite.

#include <halbox/core/logger.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    // Runner tests fork children
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    halbox::Logger::instance().set_level(halbox::LogLevel::ERROR);
    halbox::Logger::instance().set_color(false);
    return RUN_ALL_TESTS();
}
