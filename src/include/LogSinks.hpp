#pragma once

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <concepts>
#include <filesystem>
#include <memory>
#include <type_traits>
#include <utility>

// Attaches a sink to the default logger for the lifetime of this object.
template <std::derived_from<spdlog::sinks::sink> Sink>
struct RAIILogSink {
    RAIILogSink() = default;

    template <typename... Args>
    explicit RAIILogSink(Args&&... args)
        requires std::is_constructible_v<Sink, Args...> &&
                 (sizeof...(Args) != 0)
        : _sink(std::make_shared<Sink>(std::forward<Args>(args)...)) {
        spdlog::default_logger()->sinks().push_back(_sink);
    }

    ~RAIILogSink() { detach(); }

    RAIILogSink(const RAIILogSink&) = delete;
    RAIILogSink& operator=(const RAIILogSink&) = delete;

    RAIILogSink& operator=(std::shared_ptr<Sink>&& sink) & {
        detach();
        _sink = std::move(sink);
        if (_sink) {
            spdlog::default_logger()->sinks().push_back(_sink);
        }
        return *this;
    }

   private:
    void detach() {
        if (!_sink) {
            return;
        }
        auto& sinks = spdlog::default_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), _sink),
                    sinks.end());
        _sink.reset();
    }

    std::shared_ptr<Sink> _sink;
};

// Mirrors every log line into a file, appending.
using LogFileSink = spdlog::sinks::basic_file_sink_mt;
