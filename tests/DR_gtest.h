/*
 * Utility header for unit tests with gtest.
 */
#pragma once

#include <gtest/gtest.h>

#define DR_GTEST_MAIN()                                 \
int main(int argc, char *argv[])                        \
{                                                       \
    ::testing::InitGoogleTest(&argc, argv);             \
    return RUN_ALL_TESTS();                             \
}

/*
  death tests for framework misuse, DR_HAL::panic() aborts the process
 */
#define EXPECT_DR_PANIC(statement) EXPECT_DEATH(statement, "")
