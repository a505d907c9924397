#include "test_common.hpp"
#include "github_release.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace {

struct ServerLog {
    std::mutex mu;
    std::vector<std::string> heads;
    std::vector<std::string> bodies;
    std::atomic<int> served{0};
};

std::string http_response(const std::string& status, const std::string& body) {
    return "HTTP/1.1 " + status + "\r\nContent-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

size_t content_length(const std::string& head) {
    std::string lower = head;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t pos = lower.find("content-length:");
    if (pos == std::string::npos)
        return 0;
    return std::stoul(lower.substr(pos + 15));
}

int listen_loopback(uint16_t& port) {
    int srv = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    listen(srv, 4);
    socklen_t len = sizeof(addr);
    getsockname(srv, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return srv;
}

// Answers one connection per canned response, in order.
void serve(int srv, std::vector<std::string> responses, std::shared_ptr<ServerLog> log) {
    std::thread([srv, responses, log]() {
        for (const auto& resp : responses) {
            int cli = accept(srv, nullptr, nullptr);
            if (cli < 0)
                break;
            std::string data;
            char buf[4096];
            size_t head_end = std::string::npos;
            bool continued = false;
            for (;;) {
                if (head_end == std::string::npos) {
                    head_end = data.find("\r\n\r\n");
                    if (head_end != std::string::npos && !continued &&
                        data.find("100-continue") < head_end) {
                        std::string cont = "HTTP/1.1 100 Continue\r\n\r\n";
                        (void)!write(cli, cont.data(), cont.size());
                        continued = true;
                    }
                }
                if (head_end != std::string::npos &&
                    data.size() >= head_end + 4 + content_length(data.substr(0, head_end)))
                    break;
                ssize_t n = read(cli, buf, sizeof(buf));
                if (n <= 0)
                    break;
                data.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lk(log->mu);
                log->heads.push_back(data.substr(0, head_end));
                log->bodies.push_back(head_end == std::string::npos ? std::string()
                                                                    : data.substr(head_end + 4));
            }
            (void)!write(cli, resp.data(), resp.size());
            close(cli);
            ++log->served;
        }
        close(srv);
    }).detach();
}

std::string request_line(const std::string& head) { return head.substr(0, head.find("\r\n")); }

} // namespace

TEST_CASE("Release payload carries tag, notes and flags") {
    ReleaseRequest req;
    req.tag = "v1.4.0";
    req.body = "# Changes\n- faster \"hotkeys\"\n";
    req.prerelease = true;
    auto j = nlohmann::json::parse(build_release_payload(req));
    REQUIRE(j["tag_name"] == "v1.4.0");
    REQUIRE(j["name"] == "v1.4.0");
    REQUIRE(j["body"] == "# Changes\n- faster \"hotkeys\"\n");
    REQUIRE(j["draft"] == false);
    REQUIRE(j["prerelease"] == true);

    req.name = "Stratagem Hotkeys 1.4.0";
    j = nlohmann::json::parse(build_release_payload(req));
    REQUIRE(j["name"] == "Stratagem Hotkeys 1.4.0");
}

TEST_CASE("Upload URL template expansion") {
    CurlGlobalGuard curl;
    const std::string tmpl =
        "https://uploads.github.com/repos/o/r/releases/42/assets{?name,label}";
    REQUIRE(expand_upload_url(tmpl, "StratagemHotkeys-1.0.0.zip") ==
            "https://uploads.github.com/repos/o/r/releases/42/assets?name=StratagemHotkeys-1.0.0.zip");
    REQUIRE(expand_upload_url(tmpl, "my app.exe") ==
            "https://uploads.github.com/repos/o/r/releases/42/assets?name=my%20app.exe");
    REQUIRE(expand_upload_url("https://h/assets", "a") == "https://h/assets?name=a");
}

TEST_CASE("API errors are described from the response body") {
    REQUIRE(describe_api_error(401, R"({"message":"Bad credentials"})") ==
            "HTTP 401: Bad credentials");
    REQUIRE(describe_api_error(
                422,
                R"({"message":"Validation Failed","errors":[{"resource":"Release","code":"already_exists","field":"tag_name"}]})") ==
            "HTTP 422: Validation Failed (already_exists)");
    REQUIRE(describe_api_error(502, "Bad gateway\n") == "HTTP 502: Bad gateway");
    REQUIRE(describe_api_error(500, "") == "HTTP 500");
}

TEST_CASE("API token resolution") {
    fs::path token = fs::temp_directory_path() / "stratrelease_token.txt";
    write_file(token, "  ghp_secret \nsecond line\n");
    REQUIRE(resolve_api_token(token) == std::optional<std::string>("ghp_secret"));

    write_file(token, "\n");
    REQUIRE_FALSE(resolve_api_token(token));
    REQUIRE_FALSE(resolve_api_token(fs::temp_directory_path() / "stratrelease_no_token"));
    FS_REMOVE(token);

    unsetenv("GITHUB_TOKEN");
    unsetenv("GH_TOKEN");
    REQUIRE_FALSE(resolve_api_token({}));
    setenv("GH_TOKEN", "from_gh", 1);
    REQUIRE(resolve_api_token({}) == std::optional<std::string>("from_gh"));
    setenv("GITHUB_TOKEN", "from_github", 1);
    REQUIRE(resolve_api_token({}) == std::optional<std::string>("from_github"));
    unsetenv("GITHUB_TOKEN");
    unsetenv("GH_TOKEN");
}

TEST_CASE("Publishing to an unreachable API fails with an error") {
    CurlGlobalGuard curl;
    fs::path asset = fs::temp_directory_path() / "stratrelease_asset.bin";
    write_file(asset, "bin");
    GithubReleaser releaser("http://127.0.0.1:9", "o/r", "token");
    ReleaseRequest req;
    req.tag = "v0.0.1";
    req.assets = {asset};
    std::string err;
    REQUIRE_FALSE(releaser.publish(req, err));
    REQUIRE(err.find("create release") != std::string::npos);
    REQUIRE(releaser.slug() == "o/r");
    FS_REMOVE(asset);
}

TEST_CASE("Publishing creates the release and uploads each asset") {
    CurlGlobalGuard curl;
    fs::path dir = scratch_dir("stratrelease_publish_http");
    fs::path exe = dir / "StratagemHotkeys.exe";
    fs::path zip = dir / "StratagemHotkeys-1.2.3.zip";
    write_file(exe, "MZ fake executable");
    write_file(zip, std::string("PK\x03\x04", 4) + "zipped");

    uint16_t port = 0;
    int srv = listen_loopback(port);
    const std::string base = "http://127.0.0.1:" + std::to_string(port);
    nlohmann::json created{{"id", 7},
                           {"html_url", "https://github.com/o/r/releases/tag/v1.2.3"},
                           {"upload_url", base + "/uploads/repos/o/r/releases/7/assets{?name,label}"}};
    auto log = std::make_shared<ServerLog>();
    serve(srv,
          {http_response("201 Created", created.dump()), http_response("201 Created", "{}"),
           http_response("200 OK", "{}")},
          log);

    GithubReleaser releaser(base, "o/r", "tok123");
    ReleaseRequest req;
    req.tag = "v1.2.3";
    req.body = "## 1.2.3\n- Numpad hotkeys\n";
    req.assets = {exe, zip};
    std::string err;
    auto published = releaser.publish(req, err);
    INFO(err);
    REQUIRE(published);
    REQUIRE(published->id == 7);
    REQUIRE(published->html_url == "https://github.com/o/r/releases/tag/v1.2.3");

    for (int i = 0; i < 100 && log->served < 3; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    std::lock_guard<std::mutex> lk(log->mu);
    REQUIRE(log->heads.size() == 3);
    REQUIRE(request_line(log->heads[0]) == "POST /repos/o/r/releases HTTP/1.1");
    REQUIRE(log->heads[0].find("Authorization: Bearer tok123") != std::string::npos);
    auto payload = nlohmann::json::parse(log->bodies[0]);
    REQUIRE(payload["tag_name"] == "v1.2.3");
    REQUIRE(payload["body"] == "## 1.2.3\n- Numpad hotkeys\n");

    REQUIRE(request_line(log->heads[1]) ==
            "POST /uploads/repos/o/r/releases/7/assets?name=StratagemHotkeys.exe HTTP/1.1");
    REQUIRE(log->heads[1].find("Content-Type: application/octet-stream") != std::string::npos);
    REQUIRE(log->bodies[1] == "MZ fake executable");
    REQUIRE(request_line(log->heads[2]) ==
            "POST /uploads/repos/o/r/releases/7/assets?name=StratagemHotkeys-1.2.3.zip HTTP/1.1");
    REQUIRE(log->heads[2].find("Content-Type: application/zip") != std::string::npos);
    REQUIRE(log->bodies[2] == read_file(zip));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Release API errors are reported from the response body") {
    CurlGlobalGuard curl;
    uint16_t port = 0;
    int srv = listen_loopback(port);
    auto log = std::make_shared<ServerLog>();
    serve(srv,
          {http_response("422 Unprocessable Entity",
                         R"({"message":"Validation Failed","errors":[{"code":"already_exists"}]})")},
          log);

    GithubReleaser releaser("http://127.0.0.1:" + std::to_string(port), "o/r", "tok");
    ReleaseRequest req;
    req.tag = "v1.2.3";
    std::string err;
    REQUIRE_FALSE(releaser.publish(req, err));
    REQUIRE(err == "create release: HTTP 422: Validation Failed (already_exists)");
}

TEST_CASE("Release payload tolerates notes that are not UTF-8") {
    ReleaseRequest req;
    req.tag = "v1.0.0";
    req.body = "caf\xe9\n";
    std::string payload;
    REQUIRE_NOTHROW(payload = build_release_payload(req));
    auto j = nlohmann::json::parse(payload);
    REQUIRE(j["body"] == "caf\xef\xbf\xbd\n");
}
