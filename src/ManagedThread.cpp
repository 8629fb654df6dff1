#include <fmt/format.h>

#include <ManagedThreads.hpp>
#include <memory>
#include <stop_token>

void ThreadRunner::run() {
    isRunning = true;
    threadP = std::jthread(&ThreadRunner::threadFunction, this);
}

void ThreadRunner::threadFunction() {
    DLOG(INFO) << fmt::format("{} started", mgr_priv.usage);
    auto callback = std::make_unique<StopCallBackJust>(mgr_priv.stopToken,
                                                       [this] { onPreStop(); });
    runFunction(mgr_priv.stopToken);
    if (!mgr_priv.stopToken.stop_requested()) {
        LOG(WARNING) << fmt::format("{} has stopped before stop request",
                                    mgr_priv.usage);
    }
    callback.reset();
    isRunning = false;
    mgr_priv.completeLatch->count_down();
    DLOG(INFO) << fmt::format("{} finished", mgr_priv.usage);
}
