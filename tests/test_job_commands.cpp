#include "fetters/app/current_sprint.h"
#include "fetters/app/job_commands.h"

#include "fixture.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace fetters;
using fetters::core::ErrorKind;
using fetters::testing::CommandFixture;

namespace {

const std::string kAcmeLabel =
    "ID: 1 | Company: Acme | Title: Software Engineer | Status: PENDING";

}  // namespace

TEST_CASE("resolve_current_sprint returns nothing without a configured name", "[app][sprint]") {
  CommandFixture f;
  auto resolved = app::resolve_current_sprint(f.config, f.sprints);
  REQUIRE(resolved.has_value());
  CHECK_FALSE(resolved.value().has_value());

  auto required = app::require_current_sprint(f.config, f.sprints);
  REQUIRE_FALSE(required.has_value());
  CHECK(required.error().message == app::kNoCurrentSprintMessage);
}

TEST_CASE("resolve_current_sprint creates a configured sprint on first use", "[app][sprint]") {
  CommandFixture f;
  REQUIRE(f.config.save(config::FettersConfig{"  sprint_9  "}).has_value());

  auto resolved = app::resolve_current_sprint(f.config, f.sprints);
  REQUIRE(resolved.has_value());
  REQUIRE(resolved.value().has_value());
  CHECK(resolved.value()->name == "sprint_9");
  CHECK(resolved.value()->start_date == "2025-01-15");

  auto again = app::require_current_sprint(f.config, f.sprints);
  REQUIRE(again.has_value());
  CHECK(again.value().id == resolved.value()->id);
  CHECK(f.sprints.list_all().value().size() == 1);
}

TEST_CASE("add_job records a job in the current sprint", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  auto ctx = f.context({"Backend Engineer", "PENDING", " https://acme.example/1 ", "", "y"});

  auto added = app::add_job(ctx, "  Acme  ");
  REQUIRE(added.has_value());
  CHECK(added.value());
  CHECK(f.prompter->remaining() == 0);

  auto listed = f.jobs.list({}, sprint);
  REQUIRE(listed.has_value());
  REQUIRE(listed.value().size() == 1);
  const auto& job = listed.value()[0];
  CHECK(job.company_name == "Acme");
  CHECK(job.title == "Backend Engineer");
  CHECK(job.status == "PENDING");
  CHECK(job.link == "https://acme.example/1");
  CHECK_FALSE(job.notes.has_value());
  CHECK(job.created == "2025-01-15 09:30:00");
  CHECK(f.num_jobs(sprint.id) == 1);

  const std::string out = f.out.str();
  CHECK(out.find("New job application (Sprint: sprint_1)") != std::string::npos);
  CHECK(out.find("Added a new job application for Acme!") != std::string::npos);
}

TEST_CASE("add_job offers existing titles before a new one", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  f.make_job("Acme", sprint, "Data Engineer");

  SECTION("pick an existing title") {
    auto ctx = f.context({"Data Engineer", "HIRED", "", "", "y"});
    REQUIRE(app::add_job(ctx, "Beta").value());
    CHECK(f.titles.list().value().size() == 1);
  }

  SECTION("type a new title") {
    auto ctx = f.context({"<Enter a new title>", "Platform Engineer", "HIRED", "", "", "y"});
    REQUIRE(app::add_job(ctx, "Beta").value());
    CHECK(f.titles.list().value().size() == 2);
    CHECK(f.prompter->asked()[1] == "Enter the job title:");
  }

  CHECK(f.num_jobs(sprint.id) == 2);
}

TEST_CASE("add_job writes nothing when cancelled or skipped", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");

  SECTION("declined confirmation") {
    auto ctx = f.context({"Engineer", "PENDING", "", "", "n"});
    auto added = app::add_job(ctx, "Acme");
    REQUIRE(added.has_value());
    CHECK_FALSE(added.value());
    CHECK(f.out.str().find("Cancelled.") != std::string::npos);
  }

  SECTION("skipped prompt") {
    auto ctx = f.context({"Engineer", std::nullopt});
    auto added = app::add_job(ctx, "Acme");
    REQUIRE(added.has_value());
    CHECK_FALSE(added.value());
  }

  CHECK(f.num_jobs(sprint.id) == 0);
  CHECK(f.jobs.list({}, sprint).value().empty());
}

TEST_CASE("add_job requires a company and a current sprint", "[app][job]") {
  CommandFixture f;
  auto ctx = f.context({});

  auto no_sprint = app::add_job(ctx, "Acme");
  REQUIRE_FALSE(no_sprint.has_value());
  CHECK(no_sprint.error().message == app::kNoCurrentSprintMessage);
  CHECK(f.prompter->asked().empty());

  f.make_current_sprint("sprint_1");
  auto blank = app::add_job(ctx, "   ");
  REQUIRE_FALSE(blank.has_value());
  CHECK(blank.error().kind == ErrorKind::kUnknown);
}

TEST_CASE("add_job surfaces an unexpected prompt answer", "[app][job]") {
  CommandFixture f;
  f.make_current_sprint("sprint_1");
  auto ctx = f.context({"Engineer", "NOT A STATUS"});

  auto added = app::add_job(ctx, "Acme");
  REQUIRE_FALSE(added.has_value());
  CHECK(added.error().kind == ErrorKind::kPrompt);
}

TEST_CASE("list_jobs prints a table for the resolved sprint", "[app][job]") {
  CommandFixture f;
  const auto current = f.make_current_sprint("sprint_1");
  const auto other = f.make_sprint("sprint_2");
  f.make_job("Acme", current);
  f.make_job("Beta", other);
  auto ctx = f.context({});

  SECTION("current sprint by default") {
    REQUIRE(app::list_jobs(ctx, {}, false).value());
    const std::string out = f.out.str();
    CHECK(out.find("Sprint: sprint_1") != std::string::npos);
    CHECK(out.find("Acme") != std::string::npos);
    CHECK(out.find("Beta") == std::string::npos);
  }

  SECTION("explicit sprint filter") {
    domain::JobFilter filter;
    filter.sprint = "sprint_2";
    REQUIRE(app::list_jobs(ctx, filter, false).value());
    const std::string out = f.out.str();
    CHECK(out.find("Sprint: sprint_2") != std::string::npos);
    CHECK(out.find("Beta") != std::string::npos);
    CHECK(out.find("Acme") == std::string::npos);
  }
}

TEST_CASE("list_jobs emits JSON", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  const auto job = f.make_job("Acme", sprint, "Software Engineer", "HIRED", "https://a");
  f.make_stage(job.id, "Phone Screen");
  auto ctx = f.context({});

  REQUIRE(app::list_jobs(ctx, {}, true).value());
  const auto parsed = nlohmann::json::parse(f.out.str());
  REQUIRE(parsed.is_array());
  REQUIRE(parsed.size() == 1);
  CHECK(parsed[0]["company_name"] == "Acme");
  CHECK(parsed[0]["status"] == "HIRED");
  CHECK(parsed[0]["stages"] == 1);
  CHECK(parsed[0]["link"] == "https://a");
  CHECK(parsed[0]["notes"].is_null());
}

TEST_CASE("update_job applies the chosen fields", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  const auto job = f.make_job("Acme", sprint);
  auto ctx = f.context(
      {kAcmeLabel, "Company, Status, Notes", "Acme Corp", "REJECTED", "ghosted after onsite", "y"});

  auto updated = app::update_job(ctx, {});
  REQUIRE(updated.has_value());
  CHECK(updated.value());

  auto stored = f.jobs.get(job.id);
  REQUIRE(stored.has_value());
  CHECK(stored.value().company_name == "Acme Corp");
  CHECK(stored.value().status_id == f.status_id("REJECTED"));
  CHECK(stored.value().notes == "ghosted after onsite");
  CHECK(stored.value().title_id == job.title_id);
  CHECK(f.out.str().find("Updates for Acme") != std::string::npos);
}

TEST_CASE("update_job moves a job between sprints", "[app][job]") {
  CommandFixture f;
  const auto current = f.make_current_sprint("sprint_1");
  const auto target = f.make_sprint("sprint_2");
  const auto job = f.make_job("Acme", current);
  auto ctx = f.context(
      {kAcmeLabel, "Sprint", "sprint_2 (Start Date: 2025-01-15, End Date: N/A)", "y"});

  REQUIRE(app::update_job(ctx, {}).value());
  CHECK(f.jobs.get(job.id).value().sprint_id == target.id);
  CHECK(f.num_jobs(current.id) == 0);
  CHECK(f.num_jobs(target.id) == 1);
}

TEST_CASE("update_job clears a link and interns a new title", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  const auto job = f.make_job("Acme", sprint, "Software Engineer", "PENDING", "https://a");
  auto ctx = f.context(
      {kAcmeLabel, "Title, Link", "<Enter a new title>", "Staff Engineer", "-", "y"});

  REQUIRE(app::update_job(ctx, {}).value());
  auto stored = f.jobs.get(job.id).value();
  CHECK_FALSE(stored.link.has_value());
  CHECK(f.titles.get(stored.title_id).value().name == "Staff Engineer");
}

TEST_CASE("update_job without changes does not ask for confirmation", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  f.make_job("Acme", sprint);
  auto ctx = f.context({kAcmeLabel, "Company", ""});

  auto updated = app::update_job(ctx, {});
  REQUIRE(updated.has_value());
  CHECK_FALSE(updated.value());
  CHECK(f.prompter->remaining() == 0);
  CHECK(f.out.str().find("No changes to apply for Acme.") != std::string::npos);
}

TEST_CASE("select_job offers only filtered jobs", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  f.make_job("Acme", sprint);
  f.make_job("Beta", sprint);

  domain::JobFilter filter;
  filter.company = "bet";

  SECTION("a matching job can be chosen") {
    auto ctx = f.context({"ID: 2 | Company: Beta | Title: Software Engineer | Status: PENDING"});
    auto selected = app::select_job(ctx, filter, sprint);
    REQUIRE(selected.has_value());
    REQUIRE(selected.value().has_value());
    CHECK(selected.value()->company_name == "Beta");
  }

  SECTION("a filtered-out job is not an option") {
    auto ctx = f.context({kAcmeLabel});
    auto selected = app::select_job(ctx, filter, sprint);
    REQUIRE_FALSE(selected.has_value());
    CHECK(selected.error().kind == ErrorKind::kPrompt);
  }
}

TEST_CASE("job flows report an empty selection", "[app][job]") {
  CommandFixture f;
  f.make_current_sprint("sprint_1");
  auto ctx = f.context({});

  auto deleted = app::delete_job(ctx, {});
  REQUIRE_FALSE(deleted.has_value());
  CHECK(deleted.error() == core::make_error(ErrorKind::kNoJobsAvailable, "sprint_1"));

  domain::JobFilter filter;
  filter.sprint = "sprint_7";
  auto updated = app::update_job(ctx, filter);
  REQUIRE_FALSE(updated.has_value());
  CHECK(updated.error() == core::make_error(ErrorKind::kNoJobsAvailable, "sprint_7"));
}

TEST_CASE("delete_job removes the job and its stages", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  const auto job = f.make_job("Acme", sprint);
  f.make_stage(job.id, "Phone Screen");
  f.make_stage(job.id, "Onsite");
  auto ctx = f.context({kAcmeLabel, "y"});

  REQUIRE(app::delete_job(ctx, {}).value());
  REQUIRE(f.prompter->asked().size() == 2);
  CHECK(f.prompter->asked()[1] ==
        "Delete the job application for Acme and its 2 interview stage(s)?");
  CHECK_FALSE(f.jobs.get(job.id).has_value());
  CHECK(f.stages.list(job.id).value().empty());
  CHECK(f.num_jobs(sprint.id) == 0);
}

TEST_CASE("delete_job keeps the job when declined", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  const auto job = f.make_job("Acme", sprint);
  auto ctx = f.context({kAcmeLabel, "n"});

  auto deleted = app::delete_job(ctx, {});
  REQUIRE(deleted.has_value());
  CHECK_FALSE(deleted.value());
  CHECK(f.prompter->asked()[1] == "Delete the job application for Acme?");
  CHECK(f.jobs.get(job.id).has_value());
  CHECK(f.num_jobs(sprint.id) == 1);
}

TEST_CASE("open_job hands the link to the opener", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  std::vector<std::string> opened;
  const app::LinkOpener opener = [&opened](const std::string& link) {
    opened.push_back(link);
    return core::FettersResult<bool>::ok(true);
  };

  SECTION("job with a link") {
    f.make_job("Acme", sprint, "Software Engineer", "PENDING", "https://acme.example/1");
    auto ctx = f.context({kAcmeLabel});
    REQUIRE(app::open_job(ctx, {}, opener).value());
    CHECK(opened == std::vector<std::string>{"https://acme.example/1"});
  }

  SECTION("job without a link") {
    f.make_job("Acme", sprint);
    auto ctx = f.context({kAcmeLabel});
    auto result = app::open_job(ctx, {}, opener);
    REQUIRE(result.has_value());
    CHECK_FALSE(result.value());
    CHECK(opened.empty());
    CHECK(f.out.str().find("No link tracked for Acme.") != std::string::npos);
  }
}

TEST_CASE("open_job propagates opener failures", "[app][job]") {
  CommandFixture f;
  const auto sprint = f.make_current_sprint("sprint_1");
  f.make_job("Acme", sprint, "Software Engineer", "PENDING", "https://acme.example/1");
  auto ctx = f.context({kAcmeLabel});

  auto result = app::open_job(ctx, {}, [](const std::string&) {
    return core::FettersResult<bool>::err(core::make_error(ErrorKind::kIo, "xdg-open missing"));
  });
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == ErrorKind::kIo);
}
