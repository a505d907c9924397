#include "test_common.hpp"
#include "cli_commands.hpp"
#include "help_text.hpp"
#include <sstream>

namespace {
ReleaseHooks version_only_hooks(const std::string& output, int exit_code = 0) {
    ReleaseHooks hooks;
    hooks.run = [output, exit_code](const std::string&, const fs::path&, bool) {
        procutil::CommandResult res;
        res.launched = true;
        res.exit_code = exit_code;
        res.output = output;
        return res;
    };
    return hooks;
}

struct QuietLogs {
    QuietLogs() { set_console_logging(false); }
    ~QuietLogs() { set_console_logging(true); }
};
} // namespace

TEST_CASE("print_plan lists the release plan") {
    Options opts;
    opts.workdir = "/src/app";
    opts.artifact_name = "StratagemHotkeys.exe";
    std::ostringstream os;
    cli::print_plan(make_plan(opts, "1.0.0"), os);
    std::string out = os.str();
    REQUIRE(out.find("version: 1.0.0\n") != std::string::npos);
    REQUIRE(out.find("tag: v1.0.0\n") != std::string::npos);
    REQUIRE(out.find("StratagemHotkeys-1.0.0.zip") != std::string::npos);
    REQUIRE(out.find("remote: origin\n") != std::string::npos);
}

TEST_CASE("handle_plan touches nothing and reports config errors") {
    QuietLogs quiet;
    fs::path dir = scratch_dir("stratrelease_cli_plan");
    Options opts;
    opts.workdir = dir;
    std::ostringstream os;
    REQUIRE(cli::handle_plan(opts, version_only_hooks("2.5.0\n"), os) == 0);
    REQUIRE(os.str().find("tag: v2.5.0") != std::string::npos);
    REQUIRE(fs::is_empty(dir));

    std::ostringstream err_os;
    REQUIRE(cli::handle_plan(opts, version_only_hooks("\n"), err_os) == 2);
    REQUIRE(err_os.str().empty());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("handle_release maps failures to exit codes") {
    QuietLogs quiet;
    fs::path dir = scratch_dir("stratrelease_cli_release");
    Options opts;
    opts.workdir = dir;
    opts.skip_preflight = true;
    opts.skip_build = true;
    std::ostringstream os;
    REQUIRE(cli::handle_release(opts, version_only_hooks("1.0.0"), os) == 4);
    REQUIRE(os.str().empty());
    REQUIRE(cli::handle_release(opts, version_only_hooks("1.0.0", 1), os) == 2);

    opts.artifact_name = "app.bin";
    opts.dry_run = true;
    write_file(dir / "dist" / "app.bin", "binary");
    REQUIRE(cli::handle_release(opts, version_only_hooks("1.0.0"), os) == 0);
    REQUIRE(os.str() == (dir / "dist" / "StratagemHotkeys-1.0.0.zip").string() + "\n");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("setup_logging opens the configured file") {
    fs::path log = fs::temp_directory_path() / "stratrelease_cli_setup.log";
    FS_REMOVE(log);
    LoggingOptions lo;
    lo.log_file = log.string();
    lo.log_level = LogLevel::DEBUG;
    lo.console = false;
    REQUIRE(cli::setup_logging(lo));
    REQUIRE(logger_initialized());
    REQUIRE(log_level() == LogLevel::DEBUG);
    log_debug("hello");
    shutdown_logger();
    REQUIRE(read_file(log).find("hello") != std::string::npos);
    set_log_level(LogLevel::INFO);
    set_console_logging(true);
    FS_REMOVE(log);

    lo.log_file = "/nonexistent-dir/stratrelease.log";
    REQUIRE_FALSE(cli::setup_logging(lo));
    set_log_level(LogLevel::INFO);
    set_console_logging(true);
}

TEST_CASE("Help text lists options by category") {
    std::ostringstream os;
    print_help("stratrelease", os);
    std::string out = os.str();
    REQUIRE(out.find("Usage: stratrelease [options]") != std::string::npos);
    REQUIRE(out.find("Publish:") != std::string::npos);
    REQUIRE(out.find("--dry-run") != std::string::npos);
    REQUIRE(out.find("-C, --workdir <dir>") != std::string::npos);
    REQUIRE(out.find("--max-log-files") != std::string::npos);
}
