#pragma once

#include <tgbot/Bot.h>
#include <tgbot/types/CallbackQuery.h>
#include <tgbot/types/Message.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "ApprovalChannel.hpp"

/**
 * ApprovalChannel over a Telegram bot.
 *
 * Review requests go to a single admin chat as a message with Approve,
 * Reject and Edit buttons. Edit asks for the replacement text, and the next
 * text message of that user in that chat approves the request with it.
 */
class TelegramApprovalChannel : public ApprovalChannel {
   public:
    using ChatId = std::int64_t;
    using UserId = std::int64_t;

    // Without adminChat, notify() always fails and /start tells the
    // operator which chat id to configure.
    TelegramApprovalChannel(const std::string& token,
                            std::optional<ChatId> adminChat);

    absl::Status notify(RequestId id, const AnswerCandidate& candidate,
                        std::string_view question) override;
    void listen(ApprovalResolver* resolver,
                const std::stop_token& token) override;

    static std::string formatReview(const AnswerCandidate& candidate,
                                    std::string_view question);

   private:
    void onStart(const TgBot::Message::Ptr& message);
    void onCallbackQuery(const TgBot::CallbackQuery::Ptr& query);
    void onAnyMessage(const TgBot::Message::Ptr& message);

    TgBot::Bot bot_;
    std::optional<ChatId> adminChat_;
    std::atomic<ApprovalResolver*> resolver_ = nullptr;

    std::mutex editMutex_;
    // Users asked to send a replacement text, per chat
    std::map<std::pair<UserId, ChatId>, RequestId> awaitingEdit_;
};
