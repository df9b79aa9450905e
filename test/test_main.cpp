#include <gtest/gtest.h>

#include "test_util.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new selforg::test::LoggingEnvironment);
    return RUN_ALL_TESTS();
}
