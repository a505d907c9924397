#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "logger.hpp"

class ArgParser;

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool console = true;
};

struct PublishOptions {
    std::string remote_name = "origin";
    std::string github_repo;
    std::string api_url = "https://api.github.com";
    std::filesystem::path token_file;
    bool draft = false;
    bool prerelease = false;
    std::filesystem::path ssh_public_key;
    std::filesystem::path ssh_private_key;
    std::filesystem::path credential_file;
};

struct Options {
    std::filesystem::path workdir;
    std::string version_cmd;
    std::optional<std::string> release_version;
    std::string build_cmd;
    bool skip_build = false;
    std::string product = "StratagemHotkeys";
    std::string artifact_name;
    std::filesystem::path dist_dir = "dist";
    std::filesystem::path notes_file = "RELEASE.md";
    std::filesystem::path entry_script = "main.py";
    std::filesystem::path app_icon = "app.ico";
    std::vector<std::filesystem::path> resources{"app.ico", "stratagems.json", "StratagemIcons"};
    std::filesystem::path catalog_file = "stratagems.json";
    std::filesystem::path icon_dir = "StratagemIcons";
    bool skip_preflight = false;
    bool dry_run = false;
    bool print_plan = false;
    bool show_help = false;
    bool print_version = false;
    bool auto_config = false;
    std::filesystem::path config_file;
    LoggingOptions logging;
    PublishOptions publish;
};

/**
 * @brief Parse command line arguments and configuration files.
 *
 * Config files named by `--config-yaml`/`--config-json` (or discovered with
 * `--auto-config`) are read first; command line values override them.
 *
 * @throws std::runtime_error on unknown options, missing values or invalid
 *         values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Load the configuration files requested on the command line.
 *
 * Handles `--config-yaml`, `--config-json` and `--auto-config`, which looks
 * for `.stratrelease.yaml` then `.stratrelease.json` in the working directory
 * (`--workdir`) and then in the current directory.
 *
 * @param parser      The parsed command line.
 * @param cfg_opts    Receives option values keyed by long flag.
 * @param config_file Receives the path of the last file loaded.
 * @throws std::runtime_error when a file cannot be read.
 */
void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/** @brief Python interpreter used by the default commands. */
std::string default_python();

/** @brief Default version command: prints the application version. */
std::string default_version_command();

/**
 * @brief Default build command.
 *
 * A PyInstaller one-file windowed build of the entry script, named after the
 * product, with the application icon and every bundled resource passed as
 * `--add-data`. Directories keep their name inside the bundle, files land in
 * the bundle root.
 */
std::string default_build_command(const Options& opts);

/** @brief Artifact file name, `<product>.exe` on Windows when not set. */
std::string resolved_artifact_name(const Options& opts);

/** @brief Resolve @p p against the working directory. */
std::filesystem::path in_workdir(const Options& opts, const std::filesystem::path& p);

#endif // OPTIONS_HPP
