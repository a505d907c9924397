#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

std::string default_python() {
#ifdef _WIN32
    return "python";
#else
    return "python3";
#endif
}

std::string default_version_command() { return default_python() + " version.py"; }

fs::path in_workdir(const Options& opts, const fs::path& p) {
    if (p.is_absolute() || opts.workdir.empty())
        return p;
    return opts.workdir / p;
}

std::string resolved_artifact_name(const Options& opts) {
    if (!opts.artifact_name.empty())
        return opts.artifact_name;
#ifdef _WIN32
    return opts.product + ".exe";
#else
    return opts.product;
#endif
}

std::string default_build_command(const Options& opts) {
#ifdef _WIN32
    const char sep = ';';
#else
    const char sep = ':';
#endif
    std::string cmd = default_python() + " -m PyInstaller --onefile --windowed";
    cmd += " --name " + procutil::shell_quote(opts.product);
    if (!opts.app_icon.empty())
        cmd += " --icon " + procutil::shell_quote(opts.app_icon.string());
    for (const auto& res : opts.resources) {
        std::error_code ec;
        bool is_dir = fs::is_directory(in_workdir(opts, res), ec);
        std::string dest = is_dir ? res.filename().string() : std::string(".");
        cmd += " --add-data " + procutil::shell_quote(res.string() + sep + dest);
    }
    cmd += " " + procutil::shell_quote(opts.entry_script.string());
    return cmd;
}

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> switches{"--help",
                                         "--version",
                                         "--skip-build",
                                         "--skip-preflight",
                                         "--draft",
                                         "--prerelease",
                                         "--dry-run",
                                         "--plan",
                                         "--verbose",
                                         "--json-log",
                                         "--silent",
                                         "--auto-config"};
    const std::set<std::string> values{"--workdir",
                                       "--version-cmd",
                                       "--release-version",
                                       "--build-cmd",
                                       "--product",
                                       "--artifact",
                                       "--dist-dir",
                                       "--notes",
                                       "--entry-script",
                                       "--app-icon",
                                       "--resource",
                                       "--catalog",
                                       "--icon-dir",
                                       "--remote",
                                       "--github-repo",
                                       "--api-url",
                                       "--token-file",
                                       "--ssh-public-key",
                                       "--ssh-private-key",
                                       "--credential-file",
                                       "--log-file",
                                       "--log-level",
                                       "--max-log-size",
                                       "--max-log-files",
                                       "--config-yaml",
                                       "--config-json"};
    std::set<std::string> known = switches;
    known.insert(values.begin(), values.end());
    const std::map<char, std::string> short_opts{{'h', "--help"},     {'V', "--version"},
                                                 {'C', "--workdir"},  {'p', "--product"},
                                                 {'a', "--artifact"}, {'n', "--notes"},
                                                 {'r', "--remote"},   {'d', "--dry-run"},
                                                 {'l', "--log-file"}, {'L', "--log-level"},
                                                 {'v', "--verbose"},  {'s', "--silent"},
                                                 {'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser parser(argc, argv, known, values, short_opts);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");
    if (!parser.positional().empty())
        throw std::runtime_error("Unexpected argument: " + parser.positional().front());

    fs::path config_file;
    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(parser, cfg_opts, config_file);
    for (const auto& kv : cfg_opts) {
        if (!known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }

    auto flag = [&](const std::string& k) {
        if (parser.has_flag(k))
            return true;
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k + ": " + it->second);
        return v;
    };
    auto value = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::nullopt;
    };
    auto required = [&](const std::string& k, std::string& out) {
        if (auto v = value(k)) {
            if (v->empty())
                throw std::runtime_error(k + " requires a value");
            out = *v;
        }
    };
    auto required_path = [&](const std::string& k, fs::path& out) {
        std::string s;
        required(k, s);
        if (!s.empty())
            out = s;
    };

    Options opts;
    opts.config_file = config_file;
    opts.show_help = flag("--help");
    opts.print_version = flag("--version");
    opts.auto_config = flag("--auto-config");
    opts.skip_build = flag("--skip-build");
    opts.skip_preflight = flag("--skip-preflight");
    opts.dry_run = flag("--dry-run");
    opts.print_plan = flag("--plan");

    required_path("--workdir", opts.workdir);
    opts.version_cmd = default_version_command();
    required("--version-cmd", opts.version_cmd);
    if (auto v = value("--release-version"))
        opts.release_version = *v;
    required("--product", opts.product);
    required("--artifact", opts.artifact_name);
    required_path("--dist-dir", opts.dist_dir);
    required_path("--notes", opts.notes_file);
    required_path("--entry-script", opts.entry_script);
    if (auto v = value("--app-icon"))
        opts.app_icon = *v;
    if (auto v = value("--catalog"))
        opts.catalog_file = *v;
    required_path("--icon-dir", opts.icon_dir);

    if (parser.has_flag("--resource")) {
        opts.resources.clear();
        for (const auto& v : parser.get_all_options("--resource"))
            for (const auto& item : split_list(v))
                opts.resources.emplace_back(item);
    } else if (cfg_opts.count("--resource")) {
        opts.resources.clear();
        for (const auto& item : split_list(cfg_opts["--resource"]))
            opts.resources.emplace_back(item);
    }
    // The build command defaults depend on product, icon and resources.
    opts.build_cmd = default_build_command(opts);
    required("--build-cmd", opts.build_cmd);

    required("--remote", opts.publish.remote_name);
    if (auto v = value("--github-repo")) {
        std::string slug = trim(*v);
        size_t slash = slug.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == slug.size() ||
            slug.find('/', slash + 1) != std::string::npos)
            throw std::runtime_error("Invalid value for --github-repo: expected owner/name");
        opts.publish.github_repo = slug;
    }
    required("--api-url", opts.publish.api_url);
    while (!opts.publish.api_url.empty() && opts.publish.api_url.back() == '/')
        opts.publish.api_url.pop_back();
    required_path("--token-file", opts.publish.token_file);
    opts.publish.draft = flag("--draft");
    opts.publish.prerelease = flag("--prerelease");
    required_path("--ssh-public-key", opts.publish.ssh_public_key);
    required_path("--ssh-private-key", opts.publish.ssh_private_key);
    required_path("--credential-file", opts.publish.credential_file);

    if (auto v = value("--log-file"))
        opts.logging.log_file = *v;
    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (auto v = value("--log-level")) {
        if (!parse_log_level(*v, opts.logging.log_level))
            throw std::runtime_error("Invalid value for --log-level: " + *v);
    }
    if (auto v = value("--max-log-size")) {
        bool ok = false;
        opts.logging.max_log_size = parse_bytes(*v, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size: " + *v);
    }
    if (auto v = value("--max-log-files")) {
        bool ok = false;
        opts.logging.max_log_files = parse_size_t(*v, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files: " + *v);
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.console = !flag("--silent");
    return opts;
}
