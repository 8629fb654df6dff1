#pragma once

#include <absl/status/status.h>
#include <absl/strings/string_view.h>

#include <string_view>

// Error taxonomy of the bot, expressed as canonical absl::Status codes.
// Everything except AuthError (and an invalid host at startup) is recovered
// inside the current loop iteration.
namespace poll_errors {

// absl::string_view is not std::string_view in every abseil build.
inline absl::string_view toAbsl(std::string_view msg) {
    return {msg.data(), msg.size()};
}

inline absl::Status TransportError(std::string_view msg) {
    return absl::UnavailableError(toAbsl(msg));
}

inline absl::Status AuthError(std::string_view msg) {
    return absl::UnauthenticatedError(toAbsl(msg));
}

inline absl::Status InvalidHostError(std::string_view msg) {
    return absl::NotFoundError(toAbsl(msg));
}

inline absl::Status GenerationError(std::string_view msg) {
    return absl::InternalError(toAbsl(msg));
}

inline absl::Status ValidationExhausted(std::string_view msg) {
    return absl::ResourceExhaustedError(toAbsl(msg));
}

inline absl::Status EmptyOptionRange(std::string_view msg) {
    return absl::OutOfRangeError(toAbsl(msg));
}

inline absl::Status ApprovalTimeout(std::string_view msg) {
    return absl::DeadlineExceededError(toAbsl(msg));
}

inline absl::Status ApprovalRejected(std::string_view msg) {
    return absl::CancelledError(toAbsl(msg));
}

// Errors that must stop the bot instead of skipping a poll.
inline bool isFatal(const absl::Status& status) {
    return absl::IsUnauthenticated(status) || absl::IsNotFound(status);
}

}  // namespace poll_errors
