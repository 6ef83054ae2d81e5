/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Provides main() for the graft test binary. Each test file registers
 * its tests through the TEST() macro.
 *
 * Build: cmake --build . --target graft_tests
 * Run:   ./graft_tests
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
