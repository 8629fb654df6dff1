#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ManagedThreads.hpp>
#include <chrono>
#include <mutex>
#include <shared_mutex>

void ThreadManager::destroy() {
    const std::lock_guard<std::shared_mutex> _(mControllerLock);
    if (destroyed) {
        return;
    }
    destroyed = true;
    if (kControllers.empty()) {
        return;
    }
    DLOG(INFO) << "Starting ThreadManager::destroy, runners="
               << kControllers.size();
    stopSource.request_stop();
    LOG(INFO) << "Requested stop, now waiting...";

    const auto deadline = std::chrono::steady_clock::now() + kShutdownDelay;
    for (const auto& [usage, runner] : kControllers) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining < std::chrono::milliseconds::zero()) {
            remaining = std::chrono::milliseconds::zero();
        }
        if (!runner->doneLatch->wait_with_timeout(remaining)) {
            LOG(ERROR) << fmt::format(
                "Timed out waiting for {} to finish (waited {})", usage,
                kShutdownDelay);
        }
    }
    // jthread destructors join here
    kControllers.clear();
    LOG(INFO) << "All managed threads stopped";
}
