// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

static void load_config_file(const fs::path& path, std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = path.extension() == ".json" ? load_json_config(path.string(), cfg_opts, err)
                                          : load_yaml_config(path.string(), cfg_opts, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {

    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw std::runtime_error("Failed to load config: " + err);
        config_file = cfg;
    }

    bool want_auto = parser.has_flag("--auto-config");
    if (!want_auto && cfg_opts.count("--auto-config")) {
        bool ok = false;
        want_auto = parse_bool(cfg_opts["--auto-config"], ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --auto-config");
    }
    if (!want_auto)
        return;

    fs::path workdir_hint;
    if (parser.has_flag("--workdir"))
        workdir_hint = parser.get_option("--workdir");
    else if (cfg_opts.count("--workdir"))
        workdir_hint = cfg_opts["--workdir"];

    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        fs::path y = dir / ".stratrelease.yaml";
        if (fs::exists(y))
            return y;
        fs::path j = dir / ".stratrelease.json";
        if (fs::exists(j))
            return j;
        return {};
    };
    fs::path cfg_path = find_cfg(workdir_hint);
    if (cfg_path.empty())
        cfg_path = find_cfg(fs::current_path());
    if (cfg_path.empty())
        return;
    // Explicit files and the command line take precedence over discovered
    // values, so only fill in keys that are still missing.
    std::map<std::string, std::string> discovered;
    load_config_file(cfg_path, discovered);
    for (const auto& kv : discovered)
        cfg_opts.emplace(kv.first, kv.second);
    if (config_file.empty())
        config_file = cfg_path;
}
