#include <poll/StatusSink.hpp>

#include <AbslLogCompat.hpp>

void LoggingStatusSink::report(const StatusLevel level,
                               const std::string_view message) {
    switch (level) {
        case StatusLevel::Info:
        case StatusLevel::Success:
            LOG(INFO) << fmt::format("[{}] {}", level, message);
            break;
        case StatusLevel::Warning:
            LOG(WARNING) << message;
            break;
        case StatusLevel::Danger:
            LOG(ERROR) << message;
            break;
    }
}
