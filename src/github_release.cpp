#include "github_release.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>

#include "logger.hpp"
#include "parse_utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

namespace {

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;
};

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using slist_ptr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

HttpResponse post(const std::string& url, const std::string& token,
                  const std::string& content_type, const std::string& payload) {
    HttpResponse resp;
    curl_ptr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }
    slist_ptr headers(nullptr, curl_slist_free_all);
    auto add_header = [&](const std::string& h) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (next) {
            (void)headers.release();
            headers.reset(next);
        }
    };
    add_header("Accept: application/vnd.github+json");
    add_header("X-GitHub-Api-Version: 2022-11-28");
    add_header("Content-Type: " + content_type);
    add_header("Authorization: Bearer " + token);
    std::string agent = std::string("stratrelease/") + STRATRELEASE_VERSION;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        resp.error = curl_easy_strerror(rc);
        return resp;
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

std::string content_type_for(const fs::path& asset) {
    if (asset.extension() == ".zip")
        return "application/zip";
    return "application/octet-stream";
}

} // namespace

CurlGlobalGuard::CurlGlobalGuard() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlGlobalGuard::~CurlGlobalGuard() { curl_global_cleanup(); }

std::string build_release_payload(const ReleaseRequest& req) {
    nlohmann::json j{{"tag_name", req.tag},
                     {"name", req.name.empty() ? req.tag : req.name},
                     {"body", req.body},
                     {"draft", req.draft},
                     {"prerelease", req.prerelease}};
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string expand_upload_url(const std::string& upload_url_template,
                              const std::string& asset_name) {
    std::string base = upload_url_template.substr(0, upload_url_template.find('{'));
    std::string escaped = asset_name;
    if (char* e = curl_easy_escape(nullptr, asset_name.c_str(),
                                   static_cast<int>(asset_name.size()))) {
        escaped = e;
        curl_free(e);
    }
    return base + (base.find('?') == std::string::npos ? "?" : "&") + "name=" + escaped;
}

std::string describe_api_error(long status, const std::string& body) {
    std::string msg = "HTTP " + std::to_string(status);
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("message") && j["message"].is_string()) {
        msg += ": " + j["message"].get<std::string>();
        if (j.contains("errors") && j["errors"].is_array() && !j["errors"].empty()) {
            const auto& first = j["errors"].front();
            if (first.is_object() && first.contains("code") && first["code"].is_string())
                msg += " (" + first["code"].get<std::string>() + ")";
            else if (first.is_string())
                msg += " (" + first.get<std::string>() + ")";
        }
        return msg;
    }
    std::string raw = trim(body);
    if (!raw.empty())
        msg += ": " + raw.substr(0, 200);
    return msg;
}

std::optional<std::string> resolve_api_token(const fs::path& token_file) {
    if (!token_file.empty()) {
        std::ifstream ifs(token_file);
        std::string line;
        if (!ifs || !std::getline(ifs, line))
            return std::nullopt;
        line = trim(line);
        if (line.empty())
            return std::nullopt;
        return line;
    }
    for (const char* name : {"GITHUB_TOKEN", "GH_TOKEN"}) {
        const char* v = std::getenv(name);
        if (v && *v)
            return std::string(v);
    }
    return std::nullopt;
}

GithubReleaser::GithubReleaser(std::string api_url, std::string slug, std::string token)
    : api_url_(std::move(api_url)), slug_(std::move(slug)), token_(std::move(token)) {}

bool GithubReleaser::create_release(const ReleaseRequest& req, PublishedRelease& out,
                                    std::string& error) const {
    std::string url = api_url_ + "/repos/" + slug_ + "/releases";
    HttpResponse resp = post(url, token_, "application/json", build_release_payload(req));
    if (!resp.error.empty()) {
        error = "create release: " + resp.error;
        return false;
    }
    if (resp.status < 200 || resp.status >= 300) {
        error = "create release: " + describe_api_error(resp.status, resp.body);
        return false;
    }
    nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
    if (!j.is_object() || !j.contains("upload_url") || !j["upload_url"].is_string()) {
        error = "create release: unexpected response";
        return false;
    }
    out.upload_url = j["upload_url"].get<std::string>();
    if (j.contains("html_url") && j["html_url"].is_string())
        out.html_url = j["html_url"].get<std::string>();
    if (j.contains("id") && j["id"].is_number_integer())
        out.id = j["id"].get<long long>();
    return true;
}

bool GithubReleaser::upload_asset(const PublishedRelease& release, const fs::path& asset,
                                  std::string& error) const {
    std::ifstream in(asset, std::ios::binary);
    if (!in) {
        error = "upload " + asset.filename().string() + ": cannot open file";
        return false;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::string url = expand_upload_url(release.upload_url, asset.filename().string());
    HttpResponse resp = post(url, token_, content_type_for(asset), data);
    if (!resp.error.empty()) {
        error = "upload " + asset.filename().string() + ": " + resp.error;
        return false;
    }
    if (resp.status < 200 || resp.status >= 300) {
        error =
            "upload " + asset.filename().string() + ": " + describe_api_error(resp.status, resp.body);
        return false;
    }
    return true;
}

std::optional<PublishedRelease> GithubReleaser::publish(const ReleaseRequest& req,
                                                        std::string& error) const {
    PublishedRelease release;
    try {
        if (!create_release(req, release, error))
            return std::nullopt;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("create release: ") + e.what();
        return std::nullopt;
    }
    log_info("Created release", {{"repo", slug_}, {"tag", req.tag}, {"url", release.html_url}});
    for (const auto& asset : req.assets) {
        if (!upload_asset(release, asset, error))
            return std::nullopt;
        log_info("Uploaded asset", {{"name", asset.filename().string()}});
    }
    return release;
}
