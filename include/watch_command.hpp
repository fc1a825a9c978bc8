#ifndef WATCH_COMMAND_HPP
#define WATCH_COMMAND_HPP
#include <atomic>
#include <ostream>

#include "options.hpp"

/**
 * @brief Watch `opts.path` and print a diff for each change to @p out.
 *
 * Runs until @p running becomes false, then closes the watcher and drains
 * what is already queued.
 *
 * @return Process exit code: `0` after a clean stop, `1` if the path does
 *         not exist or is not a directory.
 * @throws std::system_error if the watcher cannot be created.
 */
int run_watch(const Options& opts, std::ostream& out, std::atomic<bool>& running);

/**
 * @brief run_watch() on std::cout, stopped by SIGINT or SIGTERM.
 *
 * Also sets up the log file from `opts.logging` and shuts it down on return.
 */
int run_watch(const Options& opts);

#endif // WATCH_COMMAND_HPP
