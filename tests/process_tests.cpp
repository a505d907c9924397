#include "test_common.hpp"

#ifndef _WIN32
TEST_CASE("run_command captures output and exit status") {
    auto res = procutil::run_command("printf ' 1.2.3 \\n'; exit 0", {}, true);
    REQUIRE(res.launched);
    REQUIRE(res.ok());
    REQUIRE(res.output == " 1.2.3 \n");

    auto fail = procutil::run_command("exit 3", {}, true);
    REQUIRE(fail.launched);
    REQUIRE(fail.exit_code == 3);
    REQUIRE_FALSE(fail.ok());
}

TEST_CASE("run_command runs in the working directory") {
    fs::path dir = scratch_dir("stratrelease_proc_cwd");
    auto res = procutil::run_command("echo built > marker.txt", dir);
    REQUIRE(res.ok());
    REQUIRE(fs::exists(dir / "marker.txt"));

    auto pwd = procutil::run_command("pwd", dir, true);
    REQUIRE(pwd.ok());
    REQUIRE(fs::equivalent(fs::path(trim(pwd.output)), dir));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_command reports signals and missing directories") {
    auto killed = procutil::run_command("kill -TERM $$", {}, true);
    REQUIRE(killed.launched);
    REQUIRE(killed.exit_code == 128 + 15);

    auto missing = procutil::run_command("true", "/nonexistent/stratrelease", false);
    REQUIRE(missing.exit_code == 127);
}

TEST_CASE("shell_quote protects arguments") {
    REQUIRE(procutil::shell_quote("plain") == "'plain'");
    REQUIRE(procutil::shell_quote("it's") == "'it'\\''s'");
    auto res = procutil::run_command("printf %s " + procutil::shell_quote("a b'c"), {}, true);
    REQUIRE(res.output == "a b'c");
}
#else
TEST_CASE("run_command captures output and exit status") {
    auto res = procutil::run_command("echo 1.2.3", {}, true);
    REQUIRE(res.ok());
    REQUIRE(trim(res.output) == "1.2.3");
    auto fail = procutil::run_command("exit /b 3", {}, true);
    REQUIRE(fail.exit_code == 3);
}
#endif

#ifndef _WIN32
TEST_CASE("UniqueFd transfers ownership on move") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    procutil::UniqueFd read_end(fds[0]);
    procutil::UniqueFd write_end(fds[1]);
    procutil::UniqueFd moved(std::move(write_end));
    REQUIRE_FALSE(write_end);
    REQUIRE(moved.get() == fds[1]);
    moved.reset();
    REQUIRE_FALSE(moved);
    char c = 0;
    // All writers are closed, so the reader sees end of file.
    REQUIRE(read(read_end.get(), &c, 1) == 0);
}
#endif
