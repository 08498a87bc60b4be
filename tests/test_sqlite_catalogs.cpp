#include "fetters/domain/status.h"

#include <catch2/catch_test_macros.hpp>

#include "fixture.h"

using namespace fetters;
using testing::StoreFixture;

TEST_CASE("seed inserts the default statuses once", "[sqlite][status]") {
  StoreFixture store;
  REQUIRE(store.statuses.seed().has_value());
  REQUIRE(store.statuses.seed().has_value());

  auto statuses = store.statuses.list();
  REQUIRE(statuses.has_value());
  REQUIRE(statuses.value().size() == domain::kDefaultStatuses.size());
  for (std::size_t i = 0; i < statuses.value().size(); ++i) {
    CHECK(statuses.value()[i].name == domain::kDefaultStatuses[i]);
  }
}

TEST_CASE("get_by_name finds seeded statuses and misses unknown ones", "[sqlite][status]") {
  StoreFixture store;

  auto hired = store.statuses.get_by_name("HIRED");
  REQUIRE(hired.has_value());
  REQUIRE(hired.value().has_value());
  CHECK(hired.value()->name == "HIRED");

  auto missing = store.statuses.get_by_name("ARCHIVED");
  REQUIRE(missing.has_value());
  CHECK_FALSE(missing.value().has_value());
}

TEST_CASE("get_or_create interns titles by name", "[sqlite][title]") {
  StoreFixture store;

  auto first = store.titles.get_or_create("Software Engineer");
  auto second = store.titles.get_or_create("Software Engineer");
  auto other = store.titles.get_or_create("Data Engineer");
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(other.has_value());

  CHECK(first.value().id == second.value().id);
  CHECK(first.value().id != other.value().id);

  auto titles = store.titles.list();
  REQUIRE(titles.has_value());
  REQUIRE(titles.value().size() == 2);
  CHECK(titles.value()[0].name == "Data Engineer");
  CHECK(titles.value()[1].name == "Software Engineer");
}

TEST_CASE("get on a missing title is a not-found store error", "[sqlite][title]") {
  StoreFixture store;

  auto title = store.titles.get(42);
  REQUIRE_FALSE(title.has_value());
  CHECK(title.error().kind == core::ErrorKind::kStoreResult);
}
