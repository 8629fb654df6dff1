#pragma once

#include <chrono>

#include <AbslLogCompat.hpp>

template <typename Step>
struct DurationPoint {
    explicit DurationPoint() { init(); }
    void init() {
        tp = std::chrono::steady_clock::now();
        m_isValid = true;
    }
    Step get() {
        if (m_isValid) {
            m_isValid = false;
            return std::chrono::duration_cast<Step>(
                std::chrono::steady_clock::now() - tp);
        } else {
            LOG(ERROR) << "Timer didn't start yet";
            return Step::min();
        }
    }

   private:
    std::chrono::steady_clock::time_point tp;
    bool m_isValid = false;
};

using MilliSecondDP = DurationPoint<std::chrono::milliseconds>;
