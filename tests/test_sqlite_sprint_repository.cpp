#include <catch2/catch_test_macros.hpp>

#include "fixture.h"

using namespace fetters;
using testing::StoreFixture;

TEST_CASE("add stores a sprint with a zero job count", "[sqlite][sprint]") {
  StoreFixture store;

  auto sprint = store.sprints.add(domain::NewSprint{"2025-01-15", "2025-01-15", std::nullopt, 0});
  REQUIRE(sprint.has_value());
  CHECK(sprint.value().id > 0);
  CHECK(sprint.value().name == "2025-01-15");
  CHECK(sprint.value().start_date == "2025-01-15");
  CHECK_FALSE(sprint.value().end_date.has_value());
  CHECK(sprint.value().num_jobs == 0);
}

TEST_CASE("add rejects a duplicate sprint name", "[sqlite][sprint]") {
  StoreFixture store;
  store.make_sprint("winter");

  auto duplicate = store.sprints.add(domain::NewSprint{"winter", "2025-02-01", std::nullopt, 0});
  REQUIRE_FALSE(duplicate.has_value());
  CHECK(duplicate.error().kind == core::ErrorKind::kSprintNameConflict);
  CHECK(duplicate.error().message == "winter");

  auto all = store.sprints.list_all();
  REQUIRE(all.has_value());
  CHECK(all.value().size() == 1);
}

TEST_CASE("get_or_create_by_name creates once with today's date", "[sqlite][sprint]") {
  StoreFixture store;

  auto created = store.sprints.get_or_create_by_name("spring");
  REQUIRE(created.has_value());
  CHECK(created.value().start_date == "2025-01-15");

  auto again = store.sprints.get_or_create_by_name("spring");
  REQUIRE(again.has_value());
  CHECK(again.value().id == created.value().id);
}

TEST_CASE("get_by_name does not create", "[sqlite][sprint]") {
  StoreFixture store;

  auto missing = store.sprints.get_by_name("nope");
  REQUIRE(missing.has_value());
  CHECK_FALSE(missing.value().has_value());

  auto all = store.sprints.list_all();
  REQUIRE(all.has_value());
  CHECK(all.value().empty());
}

TEST_CASE("update writes only the engaged fields", "[sqlite][sprint]") {
  StoreFixture store;
  auto sprint = store.make_sprint("winter", "2025-01-01");

  domain::SprintUpdate close;
  close.end_date = std::optional<std::string>{"2025-01-31"};
  auto closed = store.sprints.update(sprint.id, close);
  REQUIRE(closed.has_value());
  CHECK(closed.value().name == "winter");
  CHECK(closed.value().start_date == "2025-01-01");
  CHECK(closed.value().end_date == std::optional<std::string>{"2025-01-31"});

  domain::SprintUpdate reopen;
  reopen.end_date = std::optional<std::string>{};
  auto reopened = store.sprints.update(sprint.id, reopen);
  REQUIRE(reopened.has_value());
  CHECK_FALSE(reopened.value().end_date.has_value());
}

TEST_CASE("update to a taken name is a conflict", "[sqlite][sprint]") {
  StoreFixture store;
  store.make_sprint("winter");
  auto spring = store.make_sprint("spring");

  domain::SprintUpdate rename;
  rename.name = "winter";
  auto result = store.sprints.update(spring.id, rename);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kSprintNameConflict);
}

TEST_CASE("update on a missing sprint is a not-found store error", "[sqlite][sprint]") {
  StoreFixture store;

  domain::SprintUpdate rename;
  rename.name = "ghost";
  auto result = store.sprints.update(7, rename);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == core::ErrorKind::kStoreResult);
}

TEST_CASE("start_next closes the previous sprint and inserts the new one", "[sqlite][sprint]") {
  StoreFixture store;
  auto previous = store.make_sprint("sprint_1", "2025-01-01");

  auto next = store.sprints.start_next(
      domain::NewSprint{"sprint_2", "2025-01-15", std::nullopt, 0}, previous.id);
  REQUIRE(next.has_value());
  CHECK(next.value().name == "sprint_2");
  CHECK(store.sprints.get(previous.id).value().end_date ==
        std::optional<std::string>{"2025-01-15"});
}

TEST_CASE("start_next keeps an end date that is already set", "[sqlite][sprint]") {
  StoreFixture store;
  auto previous = store.make_sprint("sprint_1", "2025-01-01");
  domain::SprintUpdate closed;
  closed.end_date = std::optional<std::string>{"2025-01-10"};
  REQUIRE(store.sprints.update(previous.id, closed).has_value());

  REQUIRE(store.sprints
              .start_next(domain::NewSprint{"sprint_2", "2025-01-15", std::nullopt, 0}, previous.id)
              .has_value());
  CHECK(store.sprints.get(previous.id).value().end_date ==
        std::optional<std::string>{"2025-01-10"});
}

TEST_CASE("start_next rolls back the close when the name is taken", "[sqlite][sprint]") {
  StoreFixture store;
  auto previous = store.make_sprint("sprint_1", "2025-01-01");
  store.make_sprint("sprint_2", "2025-01-05");

  auto next = store.sprints.start_next(
      domain::NewSprint{"sprint_2", "2025-01-15", std::nullopt, 0}, previous.id);
  REQUIRE_FALSE(next.has_value());
  CHECK(next.error().kind == core::ErrorKind::kSprintNameConflict);
  CHECK_FALSE(store.sprints.get(previous.id).value().end_date.has_value());
  CHECK(store.sprints.list_all().value().size() == 2);
}

TEST_CASE("start_next with a missing previous sprint inserts nothing", "[sqlite][sprint]") {
  StoreFixture store;

  auto next = store.sprints.start_next(
      domain::NewSprint{"sprint_2", "2025-01-15", std::nullopt, 0}, std::int64_t{99});
  REQUIRE_FALSE(next.has_value());
  CHECK(next.error().kind == core::ErrorKind::kStoreResult);
  CHECK(store.sprints.list_all().value().empty());
}

TEST_CASE("decrement never takes num_jobs below zero", "[sqlite][sprint]") {
  StoreFixture store;
  auto sprint = store.make_sprint("winter");

  REQUIRE(store.sprints.increment(sprint.id).has_value());
  CHECK(store.num_jobs(sprint.id) == 1);
  REQUIRE(store.sprints.decrement(sprint.id).has_value());
  REQUIRE(store.sprints.decrement(sprint.id).has_value());
  CHECK(store.num_jobs(sprint.id) == 0);
}

TEST_CASE("list_all orders sprints by id", "[sqlite][sprint]") {
  StoreFixture store;
  store.make_sprint("b");
  store.make_sprint("a");

  auto all = store.sprints.list_all();
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 2);
  CHECK(all.value()[0].name == "b");
  CHECK(all.value()[1].name == "a");
}
