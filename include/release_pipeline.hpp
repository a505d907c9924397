#ifndef RELEASE_PIPELINE_HPP
#define RELEASE_PIPELINE_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "system_utils.hpp"

struct Options;

/** Failure categories of a release run. Each maps to a process exit code. */
enum class ReleaseErrorKind {
    Config,             ///< Bad options or unusable version string
    Preflight,          ///< Build inputs failed validation
    BuildOutputMissing, ///< Artifact absent after the build
    Archive,            ///< Archive could not be replaced or written
    Vcs,                ///< Tag creation or push failed
    Publish             ///< Notes, credentials or release API failure
};

/** @brief Short name of an error kind, used in log fields. */
const char* to_string(ReleaseErrorKind kind);

/** @brief Process exit code for an error kind. */
int exit_code_for(ReleaseErrorKind kind);

/**
 * @brief Error aborting a release run.
 */
class ReleaseError : public std::runtime_error {
  public:
    ReleaseError(ReleaseErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ReleaseErrorKind kind() const noexcept { return kind_; }
    int exit_code() const { return exit_code_for(kind_); }

  private:
    ReleaseErrorKind kind_;
};

/** Everything a release run will touch, computed before any side effect. */
struct ReleasePlan {
    std::string version;
    std::string tag;
    std::filesystem::path artifact;
    std::filesystem::path archive;
    std::filesystem::path notes;
    std::string remote;
};

struct ReleaseResult {
    ReleasePlan plan;
    bool tag_reused = false;
    bool published = false;
    std::string release_url;
};

/**
 * @brief Side effects of a release run that leave the working directory.
 *
 * The pipeline only talks to the shell, git and the release host through
 * these callables so runs can be exercised without a network.
 */
struct ReleaseHooks {
    /// Run a shell command in a directory, optionally capturing stdout.
    std::function<procutil::CommandResult(const std::string& cmd,
                                          const std::filesystem::path& workdir, bool capture)>
        run;
    /// Resolve credentials and target repository before anything is tagged.
    std::function<bool(const ReleasePlan& plan, std::string& error)> prepare_publish;
    /// Create the tag on HEAD. Sets @p existed when it was already there.
    std::function<bool(const ReleasePlan& plan, bool& existed, std::string& error)> create_tag;
    std::function<bool(const ReleasePlan& plan, std::string& error)> push_tag;
    /// Create the remote release; returns its URL.
    std::function<std::optional<std::string>(const ReleasePlan& plan, const std::string& notes,
                                             std::string& error)>
        publish;
};

/**
 * @brief Hooks backed by the platform shell, libgit2 and the GitHub API.
 */
ReleaseHooks default_release_hooks(const Options& opts);

/** @brief Tag name for a version: `v<version>`. */
std::string release_tag(const std::string& version);

/**
 * @brief Determine the version being released.
 *
 * Uses the explicit release version when one is configured, otherwise runs
 * the version command and trims its output.
 *
 * @throws ReleaseError (Config) when the command fails or the version is
 *         empty.
 */
std::string discover_version(const Options& opts, const ReleaseHooks& hooks);

/** @brief Compute the paths and names of a release of @p version. */
ReleasePlan make_plan(const Options& opts, const std::string& version);

/**
 * @brief Run the release: version, tag, preflight, build, verify, archive,
 *        publish.
 *
 * Steps run strictly in order and the first failure aborts the run. Nothing
 * is rolled back.
 *
 * @throws ReleaseError describing the failed step.
 */
ReleaseResult run_release(const Options& opts, const ReleaseHooks& hooks);

#endif // RELEASE_PIPELINE_HPP
