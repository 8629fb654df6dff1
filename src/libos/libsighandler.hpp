#pragma once

#include <atomic>

// Turns SIGINT/SIGTERM into a flag the main thread can poll.
class SignalHandler {
   public:
    /**
     * @brief Installs the signal handler.
     *
     * After calling this function, SIGINT and SIGTERM no longer terminate the
     * process but set the flag returned by isSignaled().
     */
    static void install();

    /**
     * @brief Restores the default disposition of the handled signals.
     */
    static void uninstall();

    /**
     * @brief Checks if a handled signal has been received.
     */
    static bool isSignaled() { return kUnderSignal.load(); }

   private:
    static std::atomic_bool kUnderSignal;
    static void signalHandler(int /*signum*/);
};
