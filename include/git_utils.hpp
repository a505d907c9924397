#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <string>
#include <filesystem>
#include <optional>

struct PublishOptions;

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using signature_ptr = GitHandle<git_signature, git_signature_free>;

// The utility functions below assume libgit2 is already initialized. The
// repository path may be any directory inside the work tree.

/**
 * @brief Retrieve the configured URL for a remote.
 *
 * @param repo   Path inside a Git repository.
 * @param remote Remote name.
 * @param error  Optional output string receiving error details.
 * @return Remote URL or `std::nullopt` on error.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Check whether a URL targets GitHub.
 */
bool is_github_url(const std::string& url);

/**
 * @brief Extract `owner/name` from a GitHub remote URL.
 *
 * Accepts `https://github.com/owner/name(.git)`,
 * `git@github.com:owner/name(.git)` and `ssh://git@github.com/owner/name`.
 *
 * @return Slug or `std::nullopt` when the URL is not a GitHub repository URL.
 */
std::optional<std::string> github_slug_from_url(const std::string& url);

/**
 * @brief Whether `refs/tags/<tag>` exists locally.
 */
bool tag_exists(const fs::path& repo, const std::string& tag);

/**
 * @brief Create a release tag on `HEAD`.
 *
 * An annotated tag carrying @p message is created when a default signature
 * (user.name / user.email) is configured, a lightweight tag otherwise. If the
 * tag already exists and points at `HEAD` it is left alone and @p existed is
 * set; a tag on a different commit is an error.
 *
 * @param repo    Path inside a Git repository.
 * @param tag     Tag name without the `refs/tags/` prefix.
 * @param message Annotation message.
 * @param existed Optional output flag set when the tag was already present.
 * @param error   Optional output string receiving error details.
 * @return `true` when the tag exists on `HEAD` after the call.
 */
bool create_tag(const fs::path& repo, const std::string& tag, const std::string& message,
                bool* existed = nullptr, std::string* error = nullptr);

/**
 * @brief Push `refs/tags/<tag>` to a remote.
 *
 * Credentials are supplied by credential_cb() using @p creds. A reference
 * rejected by the remote counts as a failure.
 *
 * @param repo   Path inside a Git repository.
 * @param remote Remote name.
 * @param tag    Tag name.
 * @param creds  Credential settings, may be `nullptr`.
 * @param error  Optional output string receiving error details.
 * @return `true` on success.
 */
bool push_tag(const fs::path& repo, const std::string& remote, const std::string& tag,
              const PublishOptions* creds, std::string* error = nullptr);

/**
 * @brief libgit2 credential callback.
 *
 * @p payload points at a @ref PublishOptions (or is `nullptr`). Credentials
 * are chosen in the following order:
 *  1. Explicit SSH key from the options.
 *  2. Username only.
 *  3. SSH agent.
 *  4. Username/password from the credential file.
 *  5. Username/password from `GIT_USERNAME` / `GIT_PASSWORD`.
 *  6. Default credential helper.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

} // namespace git

#endif // GIT_UTILS_HPP
