#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <string>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace procutil {

/**
 * @brief Outcome of an external command.
 *
 * @c launched is false when the shell itself could not be started; in that
 * case @c exit_code is -1 and @c error describes the failure. A command killed
 * by a signal reports `128 + signal`, matching the shell convention.
 */
struct CommandResult {
    bool launched = false;
    int exit_code = -1;
    std::string output;
    std::string error;

    bool ok() const { return launched && exit_code == 0; }
};

/**
 * @brief Run a command line through the platform shell and wait for it.
 *
 * The command is executed with `/bin/sh -c` (or `cmd.exe /c` on Windows)
 * inside @p workdir. When @p capture_output is set, standard output is
 * collected into CommandResult::output; otherwise it is inherited so build
 * tools stream their progress to the operator. Standard error is always
 * inherited. There is no timeout.
 *
 * @param command        Command line to execute.
 * @param workdir        Working directory, empty for the current one.
 * @param capture_output Collect standard output instead of inheriting it.
 */
CommandResult run_command(const std::string& command, const std::filesystem::path& workdir = {},
                          bool capture_output = false);

/**
 * @brief Quote a single argument for the platform shell.
 */
std::string shell_quote(const std::string& arg);

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    void reset(int f = -1) noexcept {
        if (fd >= 0) {
#ifdef _WIN32
            _close(fd);
#else
            close(fd);
#endif
        }
        fd = f;
    }

  private:
    int fd;
};

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
