/**
 * @file stratrelease.cpp
 * @brief CLI entry point running the Stratagem Hotkeys release.
 *
 * Parses options, sets up logging and drives the release pipeline with the
 * shell, libgit2 and the GitHub API as collaborators.
 */

#include <exception>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "github_release.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "release_pipeline.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return int Zero on success or when printing help/version; the release
 *             error's exit code on failure; 2 for invalid options; 1 on
 *             unexpected errors.
 */
#ifndef STRATRELEASE_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    CurlGlobalGuard curl_guard;
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return exit_code_for(ReleaseErrorKind::Config);
    }
    try {
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << STRATRELEASE_VERSION << "\n";
            return 0;
        }
        if (!cli::setup_logging(opts.logging))
            return exit_code_for(ReleaseErrorKind::Config);
        if (!opts.config_file.empty())
            log_debug("Loaded config", {{"path", opts.config_file.string()}});
        ReleaseHooks hooks = default_release_hooks(opts);
        int rc = opts.print_plan ? cli::handle_plan(opts, hooks)
                                 : cli::handle_release(opts, hooks);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        log_error(std::string("Unexpected error: ") + e.what());
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // STRATRELEASE_NO_MAIN
