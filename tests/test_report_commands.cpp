#include "fetters/app/report_commands.h"
#include "fetters/exporting/projection.h"

#include "fixture.h"
#include "xlsx_reader.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace fetters;
using fetters::core::ErrorKind;
using fetters::testing::CommandFixture;

namespace {

struct ExportDir {
  std::filesystem::path path;

  explicit ExportDir(const std::string& name)
      : path(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~ExportDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

}  // namespace

TEST_CASE("export_jobs writes the current sprint to the default file name", "[app][export]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  f.make_job("Acme", sprint);
  ExportDir dir("fetters_test_export_default");
  auto ctx = f.context({});

  app::ExportOptions options;
  options.directory = dir.path.string();
  auto exported = app::export_jobs(ctx, options);
  REQUIRE(exported.has_value());
  CHECK(exported.value() == dir.path / "2025-01-15-fetters-export-sprint-sprint_1.xlsx");
  CHECK(std::filesystem::is_regular_file(exported.value()));
  CHECK(f.out.str().find("Successfully exported all jobs for sprint sprint_1") !=
        std::string::npos);
}

TEST_CASE("export_jobs writes every current-sprint job in listing order", "[app][export]") {
  CommandFixture f;
  const auto previous = f.make_sprint("sprint_0");
  const auto current = f.make_current_sprint("sprint_1");
  f.make_job("Acme", current, "Software Engineer", "HIRED", std::string{"https://acme.example"},
             std::string{"referral"});
  f.make_job("Beta", current, "Data Engineer", "REJECTED");
  f.make_job("Gamma", current, "Software Engineer", "PENDING", std::string{"https://gamma.example"});
  f.make_job("Elsewhere", previous);
  ExportDir dir("fetters_test_export_rows");
  auto ctx = f.context({});

  app::ExportOptions options;
  options.directory = dir.path.string();
  auto exported = app::export_jobs(ctx, options);
  REQUIRE(exported.has_value());

  auto listed = f.jobs.list(domain::JobFilter{}, current);
  REQUIRE(listed.has_value());
  const auto expected = exporting::project_export(listed.value());
  REQUIRE(expected.size() == 3);

  const auto rows = fetters::testing::read_sheet_rows(exported.value());
  REQUIRE(rows.size() == expected.size() + 1);
  for (std::size_t i = 0; i < expected.size(); ++i) {
    const std::vector<std::string> expected_row(expected[i].begin(), expected[i].end());
    CHECK(rows[i + 1] == expected_row);
  }

  CHECK(rows[1] == std::vector<std::string>{"2025-01-15 09:30:00", "Acme", "Software Engineer",
                                            "HIRED", "https://acme.example", "referral"});
  CHECK(rows[2] == std::vector<std::string>{"2025-01-15 09:30:00", "Beta", "Data Engineer",
                                            "REJECTED", "", ""});
  CHECK(rows[3][1] == "Gamma");
  for (const auto& row : rows) {
    CHECK(row[1] != "Elsewhere");
  }
}

TEST_CASE("export_jobs honours file name and sprint options", "[app][export]") {
  CommandFixture f;
  f.make_current_sprint("sprint_1");
  const auto other = f.make_sprint("sprint_2");
  f.make_job("Beta", other);
  ExportDir dir("fetters_test_export_options");
  auto ctx = f.context({});

  app::ExportOptions options;
  options.directory = dir.path.string();
  options.filename = "report";
  options.sprint = "sprint_2";
  auto exported = app::export_jobs(ctx, options);
  REQUIRE(exported.has_value());
  CHECK(exported.value() == dir.path / "report.xlsx");
  CHECK(std::filesystem::is_regular_file(dir.path / "report.xlsx"));
}

TEST_CASE("export_jobs refuses an empty sprint", "[app][export]") {
  CommandFixture f;
  f.make_current_sprint("sprint_1");
  ExportDir dir("fetters_test_export_empty");
  auto ctx = f.context({});

  app::ExportOptions options;
  options.directory = dir.path.string();
  auto exported = app::export_jobs(ctx, options);
  REQUIRE_FALSE(exported.has_value());
  CHECK(exported.error() == core::make_error(ErrorKind::kNoJobsAvailable, "sprint_1"));
  CHECK(std::filesystem::is_empty(dir.path));
}

TEST_CASE("show_insights reports per-status and per-sprint shares", "[app][insights]") {
  CommandFixture f;
  const auto previous = f.make_sprint("sprint_0");
  const auto current = f.make_current_sprint("sprint_1");
  f.make_job("Acme", current, "Software Engineer", "PENDING");
  f.make_job("Beta", current, "Software Engineer", "HIRED");
  f.make_job("Gamma", previous, "Software Engineer", "PENDING");
  auto ctx = f.context({});

  SECTION("json") {
    REQUIRE(app::show_insights(ctx, true).value());
    const auto parsed = nlohmann::json::parse(f.out.str());
    CHECK(parsed["sprint"] == "sprint_1");

    const auto& per_status = parsed["per_status"];
    REQUIRE(per_status.size() == 2);
    CHECK(per_status[0]["label"] == "HIRED");
    CHECK(per_status[0]["count"] == 1);
    CHECK(per_status[0]["sprint_percentage"] == "50.00%");
    CHECK(per_status[0]["overall_percentage"] == "33.33%");
    CHECK(per_status[1]["label"] == "PENDING");

    const auto& per_sprint = parsed["per_sprint"];
    REQUIRE(per_sprint.size() == 2);
    CHECK(per_sprint[0]["label"] == "sprint_0");
    CHECK(per_sprint[0]["sprint_percentage"] == "50.00%");
    CHECK(per_sprint[0]["overall_percentage"] == "33.33%");
    CHECK(per_sprint[1]["label"] == "sprint_1");
    CHECK(per_sprint[1]["count"] == 2);
    CHECK(per_sprint[1]["sprint_percentage"] == "100.00%");
    CHECK(per_sprint[1]["overall_percentage"] == "66.67%");
  }

  SECTION("tables") {
    REQUIRE(app::show_insights(ctx, false).value());
    const std::string out = f.out.str();
    CHECK(out.find("Jobs per status (Sprint: sprint_1)") != std::string::npos);
    CHECK(out.find("Jobs per sprint") != std::string::npos);
    CHECK(out.find("66.67%") != std::string::npos);
  }
}

TEST_CASE("show_insights for an empty sprint prints a notice", "[app][insights]") {
  CommandFixture f;
  f.make_current_sprint("sprint_1");
  auto ctx = f.context({});

  REQUIRE(app::show_insights(ctx, false).value());
  CHECK(f.out.str().find("No insights yet: sprint sprint_1 has no job applications.") !=
        std::string::npos);
}
