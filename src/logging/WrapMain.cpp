#include "SpdlogInit.hpp"

#include <AbslLogCompat.hpp>

extern int app_main(int argc, char** argv);
int main(int argc, char** argv) {
    PollBot_SpdlogInit();
    SPDLOG_INFO("Launching {} with {} args", argv[0], argc);
    int ret = app_main(argc, argv);
    PollBot_SpdlogDeInit();
    return ret;
}
