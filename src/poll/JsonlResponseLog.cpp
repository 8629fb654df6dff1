#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <poll/ResponseLog.hpp>
#include <system_error>
#include <utility>

#include <AbslLogCompat.hpp>

using json = nlohmann::json;

namespace {

std::string_view toString(const ResponseRecord::Outcome outcome) {
    switch (outcome) {
        case ResponseRecord::Outcome::Submitted:
            return "submitted";
        case ResponseRecord::Outcome::Dropped:
            return "dropped";
        case ResponseRecord::Outcome::NoAnswer:
            return "no_answer";
    }
    return "unknown";
}

std::string isoTimestamp(const std::chrono::system_clock::time_point tp) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            tp.time_since_epoch()) %
                        std::chrono::seconds(1);
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&time, &local);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06d}", local, micros.count());
}

}  // namespace

JsonlResponseLog::JsonlResponseLog(std::filesystem::path path)
    : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        LOG_IF(ERROR, ec) << "Cannot create " << path_.parent_path() << ": "
                          << ec.message();
    }
}

std::string JsonlResponseLog::serialize(const ResponseRecord& record) {
    json entry;
    entry["timestamp"] = isoTimestamp(record.timestamp);
    entry["poll_id"] = record.poll.id;
    entry["poll_type"] = toFeedType(record.poll.kind);
    entry["question"] = record.poll.title;
    if (record.poll.kind == PollKind::MultipleChoice) {
        entry["options"] = json::array();
        for (const auto& option : record.poll.options) {
            entry["options"].push_back(
                {{"id", option.id}, {"label", option.label}});
        }
    } else {
        entry["options"] = nullptr;
    }
    if (record.candidate) {
        entry["answer"] = record.finalText.value_or(record.candidate->value());
        entry["confidence"] = record.candidate->confidence;
        entry["reasoning"] = record.candidate->reasoning;
    } else {
        entry["answer"] = nullptr;
        entry["confidence"] = nullptr;
        entry["reasoning"] = nullptr;
    }
    entry["outcome"] = toString(record.outcome);
    entry["detail"] = record.detail;
    // Generator output is not guaranteed to be valid UTF-8
    return entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

void JsonlResponseLog::append(const ResponseRecord& record) {
    std::string line;
    try {
        line = serialize(record);
    } catch (const json::exception& e) {
        LOG(ERROR) << "Cannot serialize response record: " << e.what();
        return;
    }

    const std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        LOG(ERROR) << "Cannot open response log " << path_;
        return;
    }
    out << line << '\n';
    if (!out) {
        LOG(ERROR) << "Failed to write response log " << path_;
    }
}
