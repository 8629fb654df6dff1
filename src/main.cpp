#include <curl/curl.h>
#include <fmt/format.h>

#include <DurationPoint.hpp>
#include <LogSinks.hpp>
#include <Providers.hpp>
#include <Random.hpp>
#include <approval/ApprovalBroker.hpp>
#include <approval/TelegramApprovalChannel.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <libos/libsighandler.hpp>
#include <llm/ClaudeClient.hpp>
#include <memory>
#include <poll/AnswerPipeline.hpp>
#include <poll/LocalConfirmation.hpp>
#include <poll/PollBot.hpp>
#include <poll/PollWatcher.hpp>
#include <poll/ResponseLog.hpp>
#include <poll/Settings.hpp>
#include <poll/StatusSink.hpp>
#include <poll/Validator.hpp>
#include <pollev/PollEvSession.hpp>
#include <thread>
#include <utils/CommandLine.hpp>
#include <utils/ConfigManager.hpp>

#include <AbslLogCompat.hpp>

namespace {

// How often the main thread checks for SIGINT/SIGTERM
constexpr std::chrono::milliseconds kSignalPollInterval{200};

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

}  // namespace

int app_main(int argc, char** argv) {
    MilliSecondDP startupDp;

    std::unique_ptr<ConfigManager> configMgr;
    try {
        configMgr = std::make_unique<ConfigManager>(CommandLine{argc, argv});
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "Bad command line: " << e.what();
        return EXIT_FAILURE;
    }

    // Print help and return if help option is set
    if (configMgr->helpRequested()) {
        ConfigManager::serializeHelpToOStream(std::cout);
        return EXIT_SUCCESS;
    }

    auto settings = loadSettings(*configMgr);
    if (!settings.ok()) {
        LOG(ERROR) << settings.status().message();
        return EXIT_FAILURE;
    }

    RAIILogSink<LogFileSink> logFileSink;
    if (settings->logFile) {
        try {
            logFileSink = std::make_shared<LogFileSink>(settings->logFile->string());
        } catch (const spdlog::spdlog_ex& e) {
            LOG(ERROR) << "Cannot open log file: " << e.what();
        }
    }

    SignalHandler::install();
    CurlGlobal curlGlobal;

    Random random;
    LoggingStatusSink statusSink;
    JsonlResponseLog responseLog(settings->responseLog);
    Providers providers(&random, configMgr.get(), &statusSink, &responseLog);

    PollEvSession session({.username = settings->username,
                           .password = settings->password,
                           .host = settings->host,
                           .loginType = settings->loginType});

    std::unique_ptr<ClaudeClient> claude;
    if (settings->claudeApiKey) {
        claude = std::make_unique<ClaudeClient>(*settings->claudeApiKey);
    } else {
        LOG(INFO) << "No CLAUDE_API_KEY, answering multiple choice at random";
    }

    std::unique_ptr<TelegramApprovalChannel> telegram;
    if (settings->telegramToken) {
        telegram = std::make_unique<TelegramApprovalChannel>(
            *settings->telegramToken, settings->telegramChatId);
    }
    ApprovalBroker broker(telegram.get(),
                          {.ttl = settings->approvalTtl,
                           .reapInterval = std::chrono::seconds(60)});

    Validator::Rules rules;
    rules.maxLength = settings->maxResponseLength;
    rules.minConfidence = settings->minConfidence;
    const Validator validator(rules);

    TerminalConfirmation confirmation;
    AnswerPipeline pipeline({.minOption = settings->minOption,
                             .maxOption = settings->maxOption,
                             .maxRetries = settings->maxRetries,
                             .approvalTimeout = settings->approvalTimeout,
                             .localConfirmTimeout = settings->approvalTimeout},
                            &providers, claude.get(), validator, &broker,
                            &confirmation);

    PollWatcher watcher(&session);
    PollBot::Timing timing{.closedWait = settings->closedWait,
                           .openWait = settings->openWait};
    if (settings->lifetime) {
        timing.lifetime = *settings->lifetime;
    }
    PollBot bot(timing, &providers, session, watcher, pipeline);

    LOG(INFO) << fmt::format("Startup took {}ms", startupDp.get().count());

    absl::Status result;
    std::atomic_bool finished = false;
    std::jthread runner([&bot, &result, &finished](const std::stop_token& token) {
        result = bot.run(token);
        finished = true;
    });
    while (!runner.get_stop_token().stop_requested()) {
        if (SignalHandler::isSignaled()) {
            LOG(INFO) << "Signal received, stopping after the current poll";
            runner.request_stop();
            break;
        }
        // Stops on its own when the lifetime is over
        if (finished) {
            break;
        }
        std::this_thread::sleep_for(kSignalPollInterval);
    }
    runner.join();
    SignalHandler::uninstall();

    if (!result.ok()) {
        LOG(ERROR) << "Bot exited with error: " << result;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
