#ifndef PREFLIGHT_HPP
#define PREFLIGHT_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

struct Options;

/** Findings of the pre-build checks. Errors abort the release. */
struct PreflightReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::size_t stratagem_count = 0;

    bool ok() const { return errors.empty(); }
};

/**
 * @brief Check that every bundled resource exists under @p base.
 */
void check_resources(const std::vector<std::filesystem::path>& resources,
                     const std::filesystem::path& base, PreflightReport& report);

/**
 * @brief Validate the stratagem catalog the application loads at startup.
 *
 * The catalog must be a JSON array of objects, each with a non-empty string
 * `name`, an optional string `category` and a non-empty `sequence` array of
 * direction keys (`W`, `A`, `S`, `D`, any case). Duplicate names and entries
 * without `<icon_dir>/<name>.svg` are reported as warnings; an empty
 * @p icon_dir skips the icon check.
 */
void validate_catalog(const std::filesystem::path& catalog, const std::filesystem::path& icon_dir,
                      PreflightReport& report);

/**
 * @brief Run all pre-build checks configured in @p opts.
 */
PreflightReport run_preflight(const Options& opts);

#endif // PREFLIGHT_HPP
