#include "release_pipeline.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>

#include "git_utils.hpp"
#include "github_release.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "preflight.hpp"
#include "time_utils.hpp"
#include "zip_writer.hpp"

namespace fs = std::filesystem;

const char* to_string(ReleaseErrorKind kind) {
    switch (kind) {
    case ReleaseErrorKind::Config:
        return "config";
    case ReleaseErrorKind::Preflight:
        return "preflight";
    case ReleaseErrorKind::BuildOutputMissing:
        return "build-output-missing";
    case ReleaseErrorKind::Archive:
        return "archive";
    case ReleaseErrorKind::Vcs:
        return "vcs";
    case ReleaseErrorKind::Publish:
        return "publish";
    }
    return "unknown";
}

int exit_code_for(ReleaseErrorKind kind) {
    switch (kind) {
    case ReleaseErrorKind::Config:
        return 2;
    case ReleaseErrorKind::Preflight:
        return 3;
    case ReleaseErrorKind::BuildOutputMissing:
        return 4;
    case ReleaseErrorKind::Archive:
        return 5;
    case ReleaseErrorKind::Vcs:
        return 6;
    case ReleaseErrorKind::Publish:
        return 7;
    }
    return 1;
}

namespace {

fs::path repo_dir(const Options& opts) { return opts.workdir.empty() ? fs::path(".") : opts.workdir; }

std::optional<std::string> read_notes(const fs::path& path, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "cannot read release notes " + path.string();
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void replace_archive(const ReleasePlan& plan) {
    std::error_code ec;
    if (fs::exists(plan.archive, ec)) {
        log_info("Removing previous archive", {{"path", plan.archive.string()}});
        fs::remove(plan.archive, ec);
        if (ec)
            throw ReleaseError(ReleaseErrorKind::Archive,
                               "cannot remove " + plan.archive.string() + ": " + ec.message());
    }
    std::string error;
    std::vector<ZipEntry> entries{{plan.artifact, plan.artifact.filename().string()}};
    if (!write_zip_archive(plan.archive, entries, error))
        throw ReleaseError(ReleaseErrorKind::Archive, error);
    log_info("Archive written", {{"path", plan.archive.string()},
                                 {"bytes", std::to_string(fs::file_size(plan.archive, ec))}});
}

void publish(const ReleasePlan& plan, const ReleaseHooks& hooks, ReleaseResult& result) {
    std::string error;
    auto notes = read_notes(plan.notes, error);
    if (!notes)
        throw ReleaseError(ReleaseErrorKind::Publish, error);
    size_t bad = 0;
    if (!is_valid_utf8(*notes, &bad))
        throw ReleaseError(ReleaseErrorKind::Publish,
                           "release notes " + plan.notes.string() +
                               " are not valid UTF-8 (byte offset " + std::to_string(bad) + ")");
    if (hooks.prepare_publish && !hooks.prepare_publish(plan, error))
        throw ReleaseError(ReleaseErrorKind::Publish, error);

    bool existed = false;
    if (!hooks.create_tag(plan, existed, error))
        throw ReleaseError(ReleaseErrorKind::Vcs, "tag " + plan.tag + ": " + error);
    result.tag_reused = existed;
    if (existed)
        log_warning("Tag already exists on HEAD, reusing it", {{"tag", plan.tag}});
    else
        log_info("Created tag", {{"tag", plan.tag}});

    if (!hooks.push_tag(plan, error))
        throw ReleaseError(ReleaseErrorKind::Vcs,
                           "push " + plan.tag + " to " + plan.remote + ": " + error);
    log_info("Pushed tag", {{"tag", plan.tag}, {"remote", plan.remote}});

    auto url = hooks.publish(plan, *notes, error);
    if (!url)
        throw ReleaseError(ReleaseErrorKind::Publish, error);
    result.published = true;
    result.release_url = *url;
}

} // namespace

std::string release_tag(const std::string& version) { return "v" + version; }

std::string discover_version(const Options& opts, const ReleaseHooks& hooks) {
    std::string version;
    if (opts.release_version) {
        version = trim(*opts.release_version);
        if (version.empty())
            throw ReleaseError(ReleaseErrorKind::Config, "release version is empty");
        return version;
    }
    log_debug("Running version command", {{"cmd", opts.version_cmd}});
    procutil::CommandResult res = hooks.run(opts.version_cmd, opts.workdir, true);
    if (!res.launched)
        throw ReleaseError(ReleaseErrorKind::Config, "cannot run version command: " + res.error);
    if (res.exit_code != 0)
        throw ReleaseError(ReleaseErrorKind::Config,
                           "version command exited with status " + std::to_string(res.exit_code));
    version = trim(res.output);
    if (version.empty())
        throw ReleaseError(ReleaseErrorKind::Config, "version command printed no version");
    return version;
}

ReleasePlan make_plan(const Options& opts, const std::string& version) {
    ReleasePlan plan;
    plan.version = version;
    plan.tag = release_tag(version);
    fs::path dist = in_workdir(opts, opts.dist_dir);
    plan.artifact = dist / resolved_artifact_name(opts);
    plan.archive = dist / (opts.product + "-" + version + ".zip");
    plan.notes = in_workdir(opts, opts.notes_file);
    plan.remote = opts.publish.remote_name;
    return plan;
}

ReleaseResult run_release(const Options& opts, const ReleaseHooks& hooks) {
    auto start = std::chrono::steady_clock::now();
    ReleaseResult result;
    std::string version = discover_version(opts, hooks);
    result.plan = make_plan(opts, version);
    const ReleasePlan& plan = result.plan;
    log_info("Releasing", {{"version", plan.version}, {"tag", plan.tag}});

    if (!opts.skip_preflight) {
        PreflightReport report = run_preflight(opts);
        for (const auto& w : report.warnings)
            log_warning(w);
        for (const auto& e : report.errors)
            log_error(e);
        if (!report.ok())
            throw ReleaseError(ReleaseErrorKind::Preflight,
                               std::to_string(report.errors.size()) + " preflight error(s), first: " +
                                   report.errors.front());
        log_info("Preflight passed", {{"stratagems", std::to_string(report.stratagem_count)}});
    }

    if (opts.skip_build) {
        log_info("Skipping build");
    } else {
        log_info("Building", {{"cmd", opts.build_cmd}});
        procutil::CommandResult res = hooks.run(opts.build_cmd, opts.workdir, false);
        // The artifact check below decides whether the build worked.
        if (!res.launched)
            log_warning("Build command could not be started", {{"error", res.error}});
        else if (res.exit_code != 0)
            log_warning("Build command exited with non-zero status",
                        {{"status", std::to_string(res.exit_code)}});
    }

    std::error_code ec;
    if (!fs::is_regular_file(plan.artifact, ec))
        throw ReleaseError(ReleaseErrorKind::BuildOutputMissing,
                           "build output not found: " + plan.artifact.string());
    log_info("Build output found", {{"path", plan.artifact.string()}});

    replace_archive(plan);

    if (opts.dry_run) {
        if (!fs::exists(plan.notes, ec))
            log_warning("Release notes missing", {{"path", plan.notes.string()}});
        log_info("Dry run, not publishing", {{"tag", plan.tag}, {"remote", plan.remote}});
    } else {
        publish(plan, hooks, result);
        log_info("Release published", {{"tag", plan.tag}, {"url", result.release_url}});
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log_info("Release finished", {{"elapsed", format_elapsed(elapsed)}});
    return result;
}

ReleaseHooks default_release_hooks(const Options& opts) {
    ReleaseHooks hooks;
    const fs::path repo = repo_dir(opts);
    const PublishOptions publish_opts = opts.publish;
    auto releaser = std::make_shared<std::optional<GithubReleaser>>();

    hooks.run = [](const std::string& cmd, const fs::path& workdir, bool capture) {
        return procutil::run_command(cmd, workdir, capture);
    };
    hooks.prepare_publish = [repo, publish_opts, releaser](const ReleasePlan& plan,
                                                           std::string& error) {
        std::string slug = publish_opts.github_repo;
        if (slug.empty()) {
            std::string git_err;
            auto url = git::get_remote_url(repo, plan.remote, &git_err);
            if (!url) {
                error = "cannot read URL of remote " + plan.remote + ": " + git_err;
                return false;
            }
            auto derived = git::github_slug_from_url(*url);
            if (!derived) {
                error = "remote " + plan.remote + " is not a GitHub repository (" + *url +
                        "), use --github-repo";
                return false;
            }
            slug = *derived;
        }
        auto token = resolve_api_token(publish_opts.token_file);
        if (!token) {
            error = publish_opts.token_file.empty()
                        ? "no API token, set GITHUB_TOKEN or use --token-file"
                        : "cannot read API token from " + publish_opts.token_file.string();
            return false;
        }
        releaser->emplace(publish_opts.api_url, slug, *token);
        log_debug("Publishing target resolved", {{"repo", slug}});
        return true;
    };
    hooks.create_tag = [repo](const ReleasePlan& plan, bool& existed, std::string& error) {
        return git::create_tag(repo, plan.tag, "Release " + plan.tag, &existed, &error);
    };
    hooks.push_tag = [repo, publish_opts](const ReleasePlan& plan, std::string& error) {
        return git::push_tag(repo, plan.remote, plan.tag, &publish_opts, &error);
    };
    hooks.publish = [publish_opts, releaser](const ReleasePlan& plan, const std::string& notes,
                                             std::string& error) -> std::optional<std::string> {
        if (!releaser->has_value()) {
            error = "publishing target not resolved";
            return std::nullopt;
        }
        ReleaseRequest req;
        req.tag = plan.tag;
        req.name = plan.tag;
        req.body = notes;
        req.draft = publish_opts.draft;
        req.prerelease = publish_opts.prerelease;
        req.assets = {plan.artifact, plan.archive};
        auto rel = (*releaser)->publish(req, error);
        if (!rel)
            return std::nullopt;
        return rel->html_url;
    };
    return hooks;
}
