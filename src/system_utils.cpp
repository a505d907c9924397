#include "system_utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#ifndef _WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace procutil {

#ifndef _WIN32
CommandResult run_command(const std::string& command, const fs::path& workdir,
                          bool capture_output) {
    CommandResult result;
    int pipefd[2] = {-1, -1};
    if (capture_output && pipe(pipefd) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    UniqueFd read_end(pipefd[0]);
    UniqueFd write_end(pipefd[1]);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        if (capture_output) {
            dup2(write_end.get(), STDOUT_FILENO);
            close(read_end.get());
            close(write_end.get());
        }
        if (!workdir.empty() && chdir(workdir.c_str()) != 0)
            _exit(127);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }
    result.launched = true;
    write_end.reset();
    if (capture_output) {
        char buf[4096];
        while (true) {
            ssize_t n = read(read_end.get(), buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}
#else
CommandResult run_command(const std::string& command, const fs::path& workdir,
                          bool capture_output) {
    CommandResult result;
    std::string full = command;
    if (!workdir.empty())
        full = "cd /d " + shell_quote(workdir.string()) + " && " + command;
    if (!capture_output) {
        int rc = std::system(full.c_str());
        result.launched = rc != -1;
        result.exit_code = rc;
        if (!result.launched)
            result.error = std::string("system failed: ") + std::strerror(errno);
        return result;
    }
    FILE* pipe = _popen(full.c_str(), "r");
    if (!pipe) {
        result.error = std::string("_popen failed: ") + std::strerror(errno);
        return result;
    }
    result.launched = true;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0)
        result.output.append(buf, n);
    result.exit_code = _pclose(pipe);
    return result;
}

std::string shell_quote(const std::string& arg) {
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"')
            out += "\\\"";
        else
            out += c;
    }
    out += "\"";
    return out;
}
#endif

} // namespace procutil
