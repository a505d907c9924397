#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--workdir", "-C", "<dir>", "Project directory (default: current)", "Basics"},
        {"--release-version", "", "<ver>", "Release this version instead of asking", "Basics"},
        {"--version-cmd", "", "<cmd>", "Command printing the version", "Basics"},
        {"--product", "-p", "<name>", "Product name (default StratagemHotkeys)", "Basics"},
        {"--notes", "-n", "<file>", "Release notes file (default RELEASE.md)", "Basics"},
        {"--plan", "", "", "Print the release plan and exit", "Basics"},
        {"--dry-run", "-d", "", "Build and archive, skip tagging and publishing", "Basics"},
        {"--build-cmd", "", "<cmd>", "Build command (default PyInstaller)", "Build"},
        {"--skip-build", "", "", "Reuse the existing build output", "Build"},
        {"--artifact", "-a", "<name>", "Build output file name", "Build"},
        {"--dist-dir", "", "<dir>", "Build output directory (default dist)", "Build"},
        {"--entry-script", "", "<file>", "Script packaged by the default build", "Build"},
        {"--app-icon", "", "<file>", "Executable icon for the default build", "Build"},
        {"--resource", "", "<path>", "Bundled resource (repeatable)", "Build"},
        {"--catalog", "", "<file>", "Stratagem catalog to validate", "Preflight"},
        {"--icon-dir", "", "<dir>", "Directory holding stratagem icons", "Preflight"},
        {"--skip-preflight", "", "", "Do not check build inputs", "Preflight"},
        {"--remote", "-r", "<name>", "Git remote receiving the tag (default origin)", "Publish"},
        {"--github-repo", "", "<owner/name>", "Repository for the release", "Publish"},
        {"--api-url", "", "<url>", "GitHub API base URL", "Publish"},
        {"--token-file", "", "<file>", "File holding the API token", "Publish"},
        {"--draft", "", "", "Create the release as a draft", "Publish"},
        {"--prerelease", "", "", "Mark the release as a prerelease", "Publish"},
        {"--ssh-public-key", "", "<path>", "SSH public key for pushing", "Publish"},
        {"--ssh-private-key", "", "<path>", "SSH private key for pushing", "Publish"},
        {"--credential-file", "", "<path>", "Username/password file for pushing", "Publish"},
        {"--auto-config", "", "", "Auto detect YAML or JSON config", "Config"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "File for logs", "Logging"},
        {"--log-level", "-L", "<level>", "Set log verbosity", "Logging"},
        {"--verbose", "-v", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--silent", "-s", "", "Disable console log output", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto format_flag = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, format_flag(o).size());
    }

    os << "stratrelease - Stratagem Hotkeys release tool\n";
    os << "Builds the executable, archives it, tags the commit and publishes a release.\n";
    os << "Configuration can be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " [options]\n\n";
    const std::vector<std::string> order{"Basics",  "Build",  "Preflight",
                                         "Publish", "Config", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << format_flag(*o) << o->desc
               << "\n";
        os << "\n";
    }
    os << "Exit codes: 0 success, 2 configuration, 3 preflight, 4 build output missing,\n"
          "            5 archive, 6 git, 7 publish, 1 unexpected error\n";
}
