#ifndef GITHUB_RELEASE_HPP
#define GITHUB_RELEASE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief RAII helper managing global libcurl initialization.
 */
struct CurlGlobalGuard {
    CurlGlobalGuard();  ///< Calls `curl_global_init()`
    ~CurlGlobalGuard(); ///< Calls `curl_global_cleanup()`
};

/** What to publish: release metadata plus the files to attach. */
struct ReleaseRequest {
    std::string tag;
    std::string name;
    std::string body;
    bool draft = false;
    bool prerelease = false;
    std::vector<std::filesystem::path> assets;
};

/** Release object returned by the API. */
struct PublishedRelease {
    long long id = 0;
    std::string html_url;
    std::string upload_url;
};

/** JSON body of the create-release call. */
std::string build_release_payload(const ReleaseRequest& req);

/**
 * @brief Turn the API's `upload_url` template into a concrete asset URL.
 *
 * Drops the `{?name,label}` suffix and appends `?name=<escaped name>`.
 */
std::string expand_upload_url(const std::string& upload_url_template,
                              const std::string& asset_name);

/**
 * @brief Human-readable error for a failed API call.
 *
 * Uses the `message` member of a JSON error body (plus the first entry of
 * `errors` when present) and falls back to the raw body.
 */
std::string describe_api_error(long status, const std::string& body);

/**
 * @brief Find the API token.
 *
 * Reads the first line of @p token_file when given, otherwise `GITHUB_TOKEN`
 * then `GH_TOKEN`.
 *
 * @return Token or `std::nullopt` when none is configured.
 */
std::optional<std::string> resolve_api_token(const std::filesystem::path& token_file);

/**
 * @brief Creates GitHub releases and uploads their assets.
 */
class GithubReleaser {
  public:
    GithubReleaser(std::string api_url, std::string slug, std::string token);

    /**
     * @brief Create the release and upload every asset.
     *
     * Stops at the first failure; a release created before an upload failure
     * is left in place.
     *
     * @return Created release or `std::nullopt` with @p error set.
     */
    std::optional<PublishedRelease> publish(const ReleaseRequest& req, std::string& error) const;

    const std::string& slug() const { return slug_; }

  private:
    bool create_release(const ReleaseRequest& req, PublishedRelease& out,
                        std::string& error) const;
    bool upload_asset(const PublishedRelease& release, const std::filesystem::path& asset,
                      std::string& error) const;

    std::string api_url_;
    std::string slug_;
    std::string token_;
};

#endif // GITHUB_RELEASE_HPP
