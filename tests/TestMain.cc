#include "keepsake/core/Log.hh"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    keepsake::log::init();
    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();
    keepsake::log::shutdown();
    return result;
}
