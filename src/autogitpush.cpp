/**
 * @file autogitpush.cpp
 * @brief CLI entry point for the repository commit-and-push watchdog.
 *
 * Parses options, initializes libgit2 for the process lifetime and hands
 * control to the monitoring run.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version; 1 on errors or when
 *         a single run recorded failures.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << AUTOGITPUSH_VERSION << "\n";
            return 0;
        }
        return cli::handle_monitoring_run(opts);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
