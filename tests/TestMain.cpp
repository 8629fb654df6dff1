#include <gtest/gtest.h>

#include <logging/SpdlogInit.hpp>

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    PollBot_SpdlogInit();
    int ret = RUN_ALL_TESTS();
    PollBot_SpdlogDeInit();
    return ret;
}
