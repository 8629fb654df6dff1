#include "SpdlogInit.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

static std::shared_ptr<spdlog::logger> main_logger;

void PollBot_SpdlogInit() {
    if (main_logger) return;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    main_logger = std::make_shared<spdlog::logger>("pollbot", console_sink);
    main_logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(main_logger);

    // Abseil-like: [severity] message
    spdlog::set_pattern("[%L] %v");
}

void PollBot_SpdlogDeInit() {
    if (!main_logger) {
        return;
    }
    spdlog::drop_all();
    main_logger.reset();
}
