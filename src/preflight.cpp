#include "preflight.hpp"
#include <cctype>
#include <fstream>
#include <set>
#include <nlohmann/json.hpp>
#include "options.hpp"

namespace fs = std::filesystem;

void check_resources(const std::vector<fs::path>& resources, const fs::path& base,
                     PreflightReport& report) {
    for (const auto& res : resources) {
        fs::path full = res.is_absolute() || base.empty() ? res : base / res;
        std::error_code ec;
        if (!fs::exists(full, ec))
            report.errors.push_back("missing bundled resource: " + res.string());
    }
}

static bool is_direction_key(const std::string& step) {
    if (step.size() != 1)
        return false;
    char c = static_cast<char>(std::toupper(static_cast<unsigned char>(step[0])));
    return c == 'W' || c == 'A' || c == 'S' || c == 'D';
}

void validate_catalog(const fs::path& catalog, const fs::path& icon_dir, PreflightReport& report) {
    std::ifstream ifs(catalog);
    if (!ifs) {
        report.errors.push_back("cannot open stratagem catalog " + catalog.string());
        return;
    }
    nlohmann::json root;
    try {
        ifs >> root;
    } catch (const nlohmann::json::exception& e) {
        report.errors.push_back(catalog.string() + ": " + e.what());
        return;
    }
    if (!root.is_array()) {
        report.errors.push_back(catalog.string() + ": root value is not an array");
        return;
    }
    std::set<std::string> seen;
    std::size_t index = 0;
    for (const auto& entry : root) {
        std::string where = catalog.filename().string() + "[" + std::to_string(index++) + "]";
        if (!entry.is_object()) {
            report.errors.push_back(where + ": entry is not an object");
            continue;
        }
        auto name_it = entry.find("name");
        if (name_it == entry.end() || !name_it->is_string() ||
            name_it->get<std::string>().empty()) {
            report.errors.push_back(where + ": missing or empty \"name\"");
            continue;
        }
        std::string name = name_it->get<std::string>();
        where += " (" + name + ")";
        auto cat_it = entry.find("category");
        if (cat_it != entry.end() && !cat_it->is_string())
            report.errors.push_back(where + ": \"category\" is not a string");

        auto seq_it = entry.find("sequence");
        if (seq_it == entry.end() || !seq_it->is_array() || seq_it->empty()) {
            report.errors.push_back(where + ": missing or empty \"sequence\"");
        } else {
            for (const auto& step : *seq_it) {
                if (!step.is_string() || !is_direction_key(step.get<std::string>())) {
                    report.errors.push_back(where + ": invalid sequence step " + step.dump());
                    break;
                }
            }
        }

        if (!seen.insert(name).second)
            report.warnings.push_back(where + ": duplicate name, the last definition wins");
        if (!icon_dir.empty()) {
            std::error_code ec;
            if (!fs::exists(icon_dir / (name + ".svg"), ec))
                report.warnings.push_back(where + ": no icon " + name + ".svg");
        }
        ++report.stratagem_count;
    }
}

PreflightReport run_preflight(const Options& opts) {
    PreflightReport report;
    check_resources(opts.resources, opts.workdir, report);
    if (!opts.catalog_file.empty())
        validate_catalog(in_workdir(opts, opts.catalog_file),
                         opts.icon_dir.empty() ? fs::path() : in_workdir(opts, opts.icon_dir),
                         report);
    return report;
}
