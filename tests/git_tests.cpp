#include "test_common.hpp"

using stratrelease::test_support::git_cmd;
using stratrelease::test_support::setup_repo_with_remote;

TEST_CASE("GitHub slug from remote URLs") {
    REQUIRE(git::github_slug_from_url("https://github.com/owner/StratagemHotkeys.git") ==
            "owner/StratagemHotkeys");
    REQUIRE(git::github_slug_from_url("https://github.com/owner/repo") == "owner/repo");
    REQUIRE(git::github_slug_from_url("https://github.com/owner/repo/") == "owner/repo");
    REQUIRE(git::github_slug_from_url("git@github.com:owner/repo.git") == "owner/repo");
    REQUIRE(git::github_slug_from_url("ssh://git@github.com/owner/repo.git") == "owner/repo");
    REQUIRE(git::github_slug_from_url("ssh://git@github.com:22/owner/repo") == "owner/repo");
    REQUIRE_FALSE(git::github_slug_from_url("https://gitlab.com/owner/repo.git"));
    REQUIRE_FALSE(git::github_slug_from_url("https://github.com/owner"));
    REQUIRE_FALSE(git::github_slug_from_url("https://github.com/a/b/c"));
    REQUIRE(git::is_github_url("git@github.com:o/r.git"));
    REQUIRE_FALSE(git::is_github_url("/srv/git/repo.git"));
}

TEST_CASE("create_tag tags HEAD and reuses an existing tag") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = fs::temp_directory_path() / "stratrelease_tag_local";
    fs::path remote = fs::temp_directory_path() / "stratrelease_tag_remote.git";
    setup_repo_with_remote(repo, remote);

    bool existed = true;
    std::string err;
    REQUIRE(git::create_tag(repo, "v1.0.0", "Release v1.0.0", &existed, &err));
    REQUIRE_FALSE(existed);
    REQUIRE(git::tag_exists(repo, "v1.0.0"));
    REQUIRE(git_cmd(repo, "rev-parse v1.0.0^{tag}") == 0);

    REQUIRE(git::create_tag(repo, "v1.0.0", "Release v1.0.0", &existed, &err));
    REQUIRE(existed);

    write_file(repo / "file.txt", "changed");
    REQUIRE(git_cmd(repo, "commit -am next") == 0);
    err.clear();
    REQUIRE_FALSE(git::create_tag(repo, "v1.0.0", "Release v1.0.0", &existed, &err));
    REQUIRE(err.find("already exists") != std::string::npos);

    FS_REMOVE_ALL(repo);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("push_tag publishes the tag to the remote") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path repo = fs::temp_directory_path() / "stratrelease_push_local";
    fs::path remote = fs::temp_directory_path() / "stratrelease_push_remote.git";
    setup_repo_with_remote(repo, remote);

    auto url = git::get_remote_url(repo, "origin");
    REQUIRE(url);
    REQUIRE_FALSE(git::github_slug_from_url(*url));

    std::string err;
    REQUIRE(git::create_tag(repo, "v2.1.0", "Release v2.1.0", nullptr, &err));
    PublishOptions creds;
    REQUIRE(git::push_tag(repo, "origin", "v2.1.0", &creds, &err));
    REQUIRE(git::tag_exists(remote, "v2.1.0"));

    err.clear();
    REQUIRE_FALSE(git::push_tag(repo, "nosuchremote", "v2.1.0", &creds, &err));
    REQUIRE_FALSE(err.empty());

    FS_REMOVE_ALL(repo);
    FS_REMOVE_ALL(remote);
}

TEST_CASE("Git helpers fail outside a repository") {
    git::GitInitGuard guard;
    fs::path dir = scratch_dir("stratrelease_not_git");
    std::string err;
    REQUIRE_FALSE(git::get_remote_url(dir, "origin", &err));
    REQUIRE_FALSE(err.empty());
    REQUIRE_FALSE(git::tag_exists(dir, "v1"));
    REQUIRE_FALSE(git::create_tag(dir, "v1", "m", nullptr, &err));
    FS_REMOVE_ALL(dir);
}
