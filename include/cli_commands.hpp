#pragma once

#include <iostream>

#include "options.hpp"
#include "release_pipeline.hpp"

namespace cli {

/**
 * @brief Configure the logger from the logging options.
 *
 * @return `false` when the log file cannot be opened.
 */
bool setup_logging(const LoggingOptions& opts);

/**
 * @brief Write the release plan in `key: value` form.
 */
void print_plan(const ReleasePlan& plan, std::ostream& os);

/**
 * @brief Handle `--plan`.
 *
 * Determines the version and prints the plan without touching anything.
 * Returns `0` or the exit code of the configuration error.
 */
int handle_plan(const Options& opts, const ReleaseHooks& hooks, std::ostream& os = std::cout);

/**
 * @brief Execute a release run.
 *
 * Logs failures and maps them to exit codes. The created release URL (or the
 * archive path for a dry run) is printed to @p os on success.
 */
int handle_release(const Options& opts, const ReleaseHooks& hooks, std::ostream& os = std::cout);

} // namespace cli
