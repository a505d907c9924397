#include "test_common.hpp"
#include "preflight.hpp"

namespace {
const char* kCatalog = R"([
  {"name": "Reinforce", "category": "General", "sequence": ["W", "S", "D", "A", "W"]},
  {"name": "Resupply", "sequence": ["s", "s", "w", "d"]}
])";

bool has_message(const std::vector<std::string>& msgs, const std::string& needle) {
    for (const auto& m : msgs)
        if (m.find(needle) != std::string::npos)
            return true;
    return false;
}

fs::path make_app_dir(const std::string& name, const std::string& catalog) {
    fs::path dir = scratch_dir(name);
    write_file(dir / "app.ico", "ico");
    write_file(dir / "stratagems.json", catalog);
    fs::create_directories(dir / "StratagemIcons");
    write_file(dir / "StratagemIcons" / "Reinforce.svg", "<svg/>");
    write_file(dir / "StratagemIcons" / "Resupply.svg", "<svg/>");
    return dir;
}
} // namespace

TEST_CASE("Preflight passes for a complete application tree") {
    fs::path dir = make_app_dir("stratrelease_pre_ok", kCatalog);
    Options opts;
    opts.workdir = dir;
    PreflightReport report = run_preflight(opts);
    REQUIRE(report.ok());
    REQUIRE(report.warnings.empty());
    REQUIRE(report.stratagem_count == 2);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Preflight reports missing resources") {
    fs::path dir = make_app_dir("stratrelease_pre_missing", kCatalog);
    FS_REMOVE(dir / "app.ico");
    PreflightReport report;
    check_resources({"app.ico", "stratagems.json", "StratagemIcons"}, dir, report);
    REQUIRE(report.errors.size() == 1);
    REQUIRE(has_message(report.errors, "app.ico"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Catalog validation rejects malformed entries") {
    fs::path dir = scratch_dir("stratrelease_pre_bad");
    write_file(dir / "stratagems.json", R"([
      {"name": "Good", "sequence": ["W"]},
      {"name": "", "sequence": ["W"]},
      {"name": "BadStep", "sequence": ["W", "Q"]},
      {"name": "NoSeq"},
      {"name": "EmptySeq", "sequence": []},
      {"name": "BadCat", "category": 3, "sequence": ["A"]},
      "not an object"
    ])");
    PreflightReport report;
    validate_catalog(dir / "stratagems.json", {}, report);
    REQUIRE_FALSE(report.ok());
    REQUIRE(report.errors.size() == 6);
    REQUIRE(has_message(report.errors, "missing or empty \"name\""));
    REQUIRE(has_message(report.errors, "BadStep"));
    REQUIRE(has_message(report.errors, "NoSeq"));
    REQUIRE(has_message(report.errors, "EmptySeq"));
    REQUIRE(has_message(report.errors, "\"category\" is not a string"));
    REQUIRE(has_message(report.errors, "entry is not an object"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Catalog validation rejects non-array documents") {
    fs::path dir = scratch_dir("stratrelease_pre_root");
    PreflightReport report;
    write_file(dir / "obj.json", R"({"name": "x"})");
    validate_catalog(dir / "obj.json", {}, report);
    REQUIRE(has_message(report.errors, "not an array"));

    report = PreflightReport{};
    write_file(dir / "broken.json", "[{");
    validate_catalog(dir / "broken.json", {}, report);
    REQUIRE_FALSE(report.ok());

    report = PreflightReport{};
    validate_catalog(dir / "absent.json", {}, report);
    REQUIRE(has_message(report.errors, "cannot open"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Catalog duplicates and missing icons are warnings") {
    fs::path dir = make_app_dir("stratrelease_pre_warn", R"([
      {"name": "Reinforce", "sequence": ["W"]},
      {"name": "Reinforce", "sequence": ["S"]},
      {"name": "Eagle Airstrike", "sequence": ["W", "D", "S", "D"]}
    ])");
    PreflightReport report;
    validate_catalog(dir / "stratagems.json", dir / "StratagemIcons", report);
    REQUIRE(report.ok());
    REQUIRE(report.warnings.size() == 2);
    REQUIRE(has_message(report.warnings, "duplicate name"));
    REQUIRE(has_message(report.warnings, "Eagle Airstrike.svg"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Empty catalog path disables catalog validation") {
    fs::path dir = make_app_dir("stratrelease_pre_nocat", "garbage");
    Options opts;
    opts.workdir = dir;
    opts.catalog_file.clear();
    REQUIRE(run_preflight(opts).ok());
    opts.catalog_file = "stratagems.json";
    REQUIRE_FALSE(run_preflight(opts).ok());
    FS_REMOVE_ALL(dir);
}
