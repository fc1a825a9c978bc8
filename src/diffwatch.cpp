/**
 * @file diffwatch.cpp
 * @brief CLI entry point that watches a directory and prints line diffs.
 */

#include <iostream>

#include "help_text.hpp"
#include "options.hpp"
#include "version.hpp"
#include "watch_command.hpp"

/**
 * @brief Application entry point.
 *
 * @return int Zero after a clean stop or when printing help/version; 1 on
 *             invalid options, a missing path or unexpected errors.
 */
#ifndef DIFFWATCH_NO_MAIN
int main(int argc, char* argv[]) {
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << DIFFWATCH_VERSION << "\n";
            return 0;
        }
        return run_watch(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
#endif // DIFFWATCH_NO_MAIN
