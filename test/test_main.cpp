#include <gtest/gtest.h>

/**
 * @brief Main entry point for linetrack unit tests
 *
 * All test files are automatically registered with GoogleTest.
 * Run with: ./linetrack_tests
 *
 * Or with CMake CTest: ctest --output-on-failure
 *
 * Suites that need a real git binary skip themselves when none is on PATH.
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
