/**
 * @file test_main.cpp
 * @brief GoogleTest entry point for the CTK test suite.
 */

#include <gtest/gtest.h>
#include "ctk/ctk_log.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Engine warnings are expected in fault tests; keep the output readable.
    CTK_SetLogLevel(CTK_LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
