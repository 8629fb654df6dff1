#pragma once

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <latch>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <AbslLogCompat.hpp>

struct ThreadRunner;

class LatchWithTimeout {
   public:
    explicit LatchWithTimeout(std::ptrdiff_t count) : latch(count) {}

    void count_down(std::ptrdiff_t update = 1) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            latch.count_down(update);
        }
        cv.notify_all();
    }

    bool wait_with_timeout(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, timeout, [this] { return latch.try_wait(); });
    }

   private:
    std::latch latch;
    std::condition_variable cv;
    std::mutex mtx;
};

class ThreadManager {
   public:
    ThreadManager() = default;
    ~ThreadManager() { destroy(); }

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;

    enum class Usage {
        APPROVAL_LISTENER_THREAD,
        APPROVAL_REAPER_THREAD,
        MAX
    };

    // Create and start a runner for the given usage.
    // Returns nullptr if that usage is already taken or the manager is
    // shutting down.
    template <std::derived_from<ThreadRunner> T = ThreadRunner,
              typename... Args>
        requires std::is_constructible_v<T, Args...>
    T* create(Usage usage, Args&&... args);

    template <std::derived_from<ThreadRunner> T = ThreadRunner>
    T* get(Usage usage);

    // Stop all runners managed by this manager, and wait for them to finish.
    void destroy();

   private:
    constexpr static std::chrono::seconds kShutdownDelay{5};

    std::shared_mutex mControllerLock;
    std::unordered_map<Usage, std::unique_ptr<ThreadRunner>> kControllers;
    std::stop_source stopSource;
    bool destroyed = false;
};

template <>
struct fmt::formatter<ThreadManager::Usage> : formatter<std::string_view> {
    // parse is inherited from formatter<string_view>.
    auto format(ThreadManager::Usage c,
                format_context& ctx) const -> format_context::iterator {
        string_view name = "unknown";
        switch (c) {
            case ThreadManager::Usage::APPROVAL_LISTENER_THREAD:
                name = "APPROVAL_LISTENER_THREAD";
                break;
            case ThreadManager::Usage::APPROVAL_REAPER_THREAD:
                name = "APPROVAL_REAPER_THREAD";
                break;
            default:
                LOG(ERROR) << "Unknown usage: " << static_cast<int>(c);
                break;
        }
        return formatter<string_view>::format(name, ctx);
    }
};

struct ThreadRunner {
    using just_function = std::function<void(void)>;
    using StopCallBackJust = std::stop_callback<just_function>;

    ThreadRunner() = default;
    virtual ~ThreadRunner() = default;

    ThreadRunner(const ThreadRunner&) = delete;
    ThreadRunner& operator=(const ThreadRunner&) = delete;

    friend class ThreadManager;

    [[nodiscard]] bool running() const noexcept { return isRunning; }

   protected:
    // The main thread function.
    virtual void runFunction(const std::stop_token& token) = 0;

    // The function called before (or to make it) stop.
    virtual void onPreStop() {}

   private:
    // Spawn the thread, called by ThreadManager once mgr_priv is filled.
    void run();
    // Wrapper around 'runFunction'
    void threadFunction();

    std::jthread threadP;
    std::atomic_bool isRunning = false;

    struct {
        ThreadManager::Usage usage{};
        std::stop_token stopToken;
        LatchWithTimeout* completeLatch{};
    } mgr_priv{};
    std::shared_ptr<LatchWithTimeout> doneLatch =
        std::make_shared<LatchWithTimeout>(1);
};

template <std::derived_from<ThreadRunner> T, typename... Args>
    requires std::is_constructible_v<T, Args...>
T* ThreadManager::create(Usage usage, Args&&... args) {
    std::lock_guard<std::shared_mutex> lock(mControllerLock);

    if (destroyed) {
        LOG(ERROR) << fmt::format("MGR: Refusing to start {} after destroy",
                                  usage);
        return nullptr;
    }
    if (kControllers.contains(usage)) {
        LOG(ERROR) << fmt::format("MGR: {} has already started", usage);
        return nullptr;
    }

    LOG(INFO) << fmt::format("MGR: Starting {}...", usage);
    auto newIt = std::make_unique<T>(std::forward<Args>(args)...);
    newIt->mgr_priv.usage = usage;
    newIt->mgr_priv.stopToken = stopSource.get_token();
    newIt->mgr_priv.completeLatch = newIt->doneLatch.get();
    auto* raw = newIt.get();
    kControllers[usage] = std::move(newIt);
    raw->run();
    return raw;
}

template <std::derived_from<ThreadRunner> T>
T* ThreadManager::get(Usage usage) {
    std::shared_lock<std::shared_mutex> lock(mControllerLock);
    auto it = kControllers.find(usage);
    if (it == kControllers.end()) {
        DLOG(WARNING) << fmt::format("MGR: {} is not created", usage);
        return nullptr;
    }
    return dynamic_cast<T*>(it->second.get());
}
