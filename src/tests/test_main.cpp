#include <gtest/gtest.h>
#include "test_utils.hpp"

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    init_test_logging();
    return RUN_ALL_TESTS();
}
