#include <iostream>

#include "cli_commands.hpp"
#include "logger.hpp"

namespace cli {

namespace {
int report_failure(const ReleaseError& e) {
    log_error(e.what(), {{"kind", to_string(e.kind())}});
    if (!console_logging())
        std::cerr << e.what() << "\n";
    return e.exit_code();
}
} // namespace

bool setup_logging(const LoggingOptions& opts) {
    set_log_level(opts.log_level);
    set_json_logging(opts.json_log);
    set_console_logging(opts.console);
    if (opts.log_file.empty())
        return true;
    return init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
}

void print_plan(const ReleasePlan& plan, std::ostream& os) {
    os << "version: " << plan.version << "\n";
    os << "tag: " << plan.tag << "\n";
    os << "artifact: " << plan.artifact.string() << "\n";
    os << "archive: " << plan.archive.string() << "\n";
    os << "notes: " << plan.notes.string() << "\n";
    os << "remote: " << plan.remote << "\n";
}

int handle_plan(const Options& opts, const ReleaseHooks& hooks, std::ostream& os) {
    try {
        print_plan(make_plan(opts, discover_version(opts, hooks)), os);
        return 0;
    } catch (const ReleaseError& e) {
        return report_failure(e);
    }
}

int handle_release(const Options& opts, const ReleaseHooks& hooks, std::ostream& os) {
    try {
        ReleaseResult result = run_release(opts, hooks);
        if (result.published)
            os << result.release_url << "\n";
        else
            os << result.plan.archive.string() << "\n";
        return 0;
    } catch (const ReleaseError& e) {
        return report_failure(e);
    }
}

} // namespace cli
