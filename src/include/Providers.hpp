#pragma once

#include <Random.hpp>

#include "poll/ResponseLog.hpp"
#include "poll/StatusSink.hpp"
#include "utils/ConfigManager.hpp"

// Process wide collaborators, passed explicitly to whoever needs them.
class Providers {
    // 'Installable' subcomponents
    template <typename T>
    struct Installable {
        T *instance;

        [[nodiscard]] T *get() const { return instance; }
        T *operator->() const { return get(); }
        explicit operator bool() const { return instance != nullptr; }
    };

   public:
    Installable<RandomBase> random{};
    Installable<ConfigManager> config{};
    Installable<StatusSink> status{};
    Installable<ResponseLog> responseLog{};

    Providers(RandomBase *random, ConfigManager *configManager,
              StatusSink *status, ResponseLog *responseLog) {
        this->random.instance = random;
        this->config.instance = configManager;
        this->status.instance = status;
        this->responseLog.instance = responseLog;
    }
};
