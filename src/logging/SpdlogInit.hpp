#pragma once

/**
 * Initializes spdlog as the logging backend of PollBot.
 * Installs a colored stderr logger named "pollbot" and makes it the default
 * logger, so that the LOG() macros from AbslLogCompat.hpp reach it.
 *
 * @note Safe to call more than once; only the first call has an effect.
 */
extern void PollBot_SpdlogInit();

// Deregister and cleanup spdlog
extern void PollBot_SpdlogDeInit();
