#include <absl/status/status.h>
#include <fmt/format.h>
#include <tgbot/net/TgLongPoll.h>
#include <tgbot/types/ReplyParameters.h>

#include <approval/CallbackData.hpp>
#include <approval/KeyboardBuilder.hpp>
#include <approval/TelegramApprovalChannel.hpp>
#include <chrono>
#include <exception>
#include <thread>

#include <AbslLogCompat.hpp>

namespace {

constexpr std::string_view kExpired = "Response expired or not found!";
// Seconds a single long poll may block, bounds how long stopping takes
constexpr std::int32_t kLongPollTimeout = 1;

TgBot::ReplyParameters::Ptr replyTo(const TgBot::Message::Ptr& message) {
    auto params = std::make_shared<TgBot::ReplyParameters>();
    params->messageId = message->messageId;
    params->chatId = message->chat->id;
    return params;
}

}  // namespace

TelegramApprovalChannel::TelegramApprovalChannel(
    const std::string& token, std::optional<ChatId> adminChat)
    : bot_(token), adminChat_(adminChat) {
    bot_.getEvents().onCommand("start", [this](TgBot::Message::Ptr message) {
        onStart(message);
    });
    bot_.getEvents().onCallbackQuery([this](TgBot::CallbackQuery::Ptr query) {
        onCallbackQuery(query);
    });
    bot_.getEvents().onNonCommandMessage(
        [this](TgBot::Message::Ptr message) { onAnyMessage(message); });
    if (!adminChat_) {
        LOG(INFO) << "No Telegram chat id configured. Message the bot with "
                     "/start to get it";
    }
}

std::string TelegramApprovalChannel::formatReview(
    const AnswerCandidate& candidate, const std::string_view question) {
    return fmt::format(
        "New Response Needs Review:\n\nQuestion:\n{}\n\nProposed "
        "Answer:\n{}\n\nConfidence: {:.2f}\nReasoning: {}",
        question, candidate.text, candidate.confidence, candidate.reasoning);
}

absl::Status TelegramApprovalChannel::notify(const RequestId id,
                                             const AnswerCandidate& candidate,
                                             const std::string_view question) {
    if (!adminChat_) {
        LOG(WARNING) << "No admin chat id set, skipping Telegram notification";
        return absl::FailedPreconditionError("No Telegram admin chat");
    }

    auto keyboard =
        KeyboardBuilder(3)
            .addKeyboard({{"Approve", CallbackData{ApprovalAction::Approve, id}.str()},
                          {"Reject", CallbackData{ApprovalAction::Reject, id}.str()},
                          {"Edit", CallbackData{ApprovalAction::Edit, id}.str()}})
            .get();
    try {
        bot_.getApi().sendMessage(*adminChat_, formatReview(candidate, question),
                                  nullptr, nullptr, keyboard);
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Failed to send Telegram message: " << ex.what();
        return absl::UnavailableError(ex.what());
    }
    return absl::OkStatus();
}

void TelegramApprovalChannel::listen(ApprovalResolver* resolver,
                                     const std::stop_token& token) {
    resolver_ = resolver;
    try {
        bot_.getApi().deleteWebhook();
    } catch (const std::exception& ex) {
        LOG(WARNING) << "Cannot delete webhook: " << ex.what();
    }

    TgBot::TgLongPoll longPoll(bot_, 100, kLongPollTimeout);
    LOG(INFO) << "Telegram listener started";
    while (!token.stop_requested()) {
        try {
            longPoll.start();
        } catch (const std::exception& ex) {
            LOG_EVERY_N_SEC(ERROR, 30) << "Telegram long poll failed: " << ex.what();
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    resolver_ = nullptr;
    LOG(INFO) << "Telegram listener stopped";
}

void TelegramApprovalChannel::onStart(const TgBot::Message::Ptr& message) {
    try {
        bot_.getApi().sendMessage(
            message->chat->id,
            fmt::format("Welcome! Your chat ID is: {}\nSet this as "
                        "TELEGRAM_CHAT_ID in your configuration.",
                        message->chat->id),
            nullptr, replyTo(message));
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Cannot answer /start: " << ex.what();
    }
}

void TelegramApprovalChannel::onCallbackQuery(
    const TgBot::CallbackQuery::Ptr& query) {
    auto* resolver = resolver_.load();
    const auto data = CallbackData::parse(query->data);
    if (!data || resolver == nullptr || !query->message) {
        return;
    }

    auto& api = bot_.getApi();
    try {
        if (!resolver->isPending(data->id)) {
            api.answerCallbackQuery(query->id, std::string(kExpired));
            return;
        }

        switch (data->action) {
            case ApprovalAction::Approve:
            case ApprovalAction::Reject: {
                if (!resolver->resolve(data->id, data->action, std::nullopt)) {
                    api.answerCallbackQuery(query->id, std::string(kExpired));
                    return;
                }
                const bool approved = data->action == ApprovalAction::Approve;
                api.answerCallbackQuery(
                    query->id, approved ? "Response approved!"
                                        : "Response rejected!");
                // Editing the text without a markup drops the buttons
                api.editMessageText(
                    fmt::format("{}\n\n{}", query->message->text,
                                approved ? "Approved" : "Rejected"),
                    query->message->chat->id, query->message->messageId);
                break;
            }
            case ApprovalAction::Edit: {
                api.answerCallbackQuery(query->id);
                {
                    const std::lock_guard<std::mutex> lock(editMutex_);
                    awaitingEdit_[{query->from->id, query->message->chat->id}] =
                        data->id;
                }
                api.sendMessage(query->message->chat->id,
                                "Please send the modified answer:", nullptr,
                                replyTo(query->message));
                break;
            }
        }
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Failed to handle approval button: " << ex.what();
    }
}

void TelegramApprovalChannel::onAnyMessage(const TgBot::Message::Ptr& message) {
    auto* resolver = resolver_.load();
    if (resolver == nullptr || !message->from || message->text.empty()) {
        return;
    }

    std::optional<RequestId> id;
    {
        const std::lock_guard<std::mutex> lock(editMutex_);
        auto it = awaitingEdit_.find({message->from->id, message->chat->id});
        if (it == awaitingEdit_.end()) {
            return;
        }
        id = it->second;
        awaitingEdit_.erase(it);
    }

    const bool applied =
        resolver->resolve(*id, ApprovalAction::Edit, message->text);
    try {
        bot_.getApi().sendMessage(
            message->chat->id,
            applied ? "Response updated and approved!" : std::string(kExpired),
            nullptr, replyTo(message));
    } catch (const std::exception& ex) {
        LOG(ERROR) << "Cannot confirm edit: " << ex.what();
    }
}
