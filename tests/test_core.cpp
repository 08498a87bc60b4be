#include "fetters/core/clock.h"
#include "fetters/core/dates.h"
#include "fetters/core/error.h"
#include "fetters/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

using namespace fetters::core;

TEST_CASE("parse_date accepts valid dates with the given separator", "[core][dates]") {
  auto iso = parse_date("2025-01-15", kIsoDateSeparator);
  REQUIRE(iso.has_value());
  CHECK(iso.value() == CalendarDate{2025, 1, 15});

  auto stage = parse_date("2024/02/29", kStageDateSeparator);
  REQUIRE(stage.has_value());
  CHECK(stage.value() == CalendarDate{2024, 2, 29});
}

TEST_CASE("parse_date rejects malformed and out-of-range dates", "[core][dates]") {
  CHECK_FALSE(parse_date("2025/01/15", kIsoDateSeparator).has_value());
  CHECK_FALSE(parse_date("2025-1-15", kIsoDateSeparator).has_value());
  CHECK_FALSE(parse_date("2025-13-01", kIsoDateSeparator).has_value());
  CHECK_FALSE(parse_date("2025-04-31", kIsoDateSeparator).has_value());
  CHECK_FALSE(parse_date("2023-02-29", kIsoDateSeparator).has_value());
  CHECK_FALSE(parse_date("2025-01-15 ", kIsoDateSeparator).has_value());
  CHECK_FALSE(parse_date("", kIsoDateSeparator).has_value());
}

TEST_CASE("format_date zero-pads every component", "[core][dates]") {
  CHECK(format_date(CalendarDate{2025, 3, 7}, kStageDateSeparator) == "2025/03/07");
  CHECK(format_date(CalendarDate{987, 12, 31}, kIsoDateSeparator) == "0987-12-31");
}

TEST_CASE("is_valid_timestamp checks the job creation format", "[core][dates]") {
  CHECK(is_valid_timestamp("2025-01-15 09:30:00"));
  CHECK_FALSE(is_valid_timestamp("2025-01-15T09:30:00"));
  CHECK_FALSE(is_valid_timestamp("2025-01-15 25:00:00"));
  CHECK_FALSE(is_valid_timestamp("2025-01-15"));
}

TEST_CASE("leap years follow the Gregorian rules", "[core][dates]") {
  CHECK(is_leap_year(2024));
  CHECK(is_leap_year(2000));
  CHECK_FALSE(is_leap_year(1900));
  CHECK(days_in_month(2024, 2) == 29);
  CHECK(days_in_month(2025, 2) == 28);
  CHECK(days_in_month(2025, 13) == 0);
}

TEST_CASE("FixedClock splits its timestamp into date and time", "[core][clock]") {
  FixedClock clock("2025-01-15 09:30:00");
  CHECK(clock.today() == "2025-01-15");
  CHECK(clock.now_timestamp() == "2025-01-15 09:30:00");
}

TEST_CASE("SystemClock produces well-formed values", "[core][clock]") {
  SystemClock clock;
  CHECK(parse_date(clock.today(), kIsoDateSeparator).has_value());
  CHECK(is_valid_timestamp(clock.now_timestamp()));
}

TEST_CASE("to_string renders one line per error kind", "[core][error]") {
  CHECK(to_string(make_error(ErrorKind::kApplicationDirUnavailable)) ==
        "Could not retrieve system application directories!");
  CHECK(to_string(make_error(ErrorKind::kStoreResult, "no such table")) ==
        "SQLite query error: no such table");
  CHECK(to_string(make_error(ErrorKind::kIo, "denied")) == "IO Error: denied");
  CHECK(to_string(make_error(ErrorKind::kPrompt, "closed")) == "Prompt error: closed");
  CHECK(to_string(make_error(ErrorKind::kMigration)) == "Failed to run migrations!");
  CHECK(to_string(make_error(ErrorKind::kMigration, "v2")) == "Failed to run migrations! (v2)");
  CHECK(to_string(make_error(ErrorKind::kNoJobsAvailable, "2025-01-15")) ==
        "No job applications tracked for the current sprint [2025-01-15]");
  CHECK(to_string(make_error(ErrorKind::kSheetName, "too long")) ==
        "Set sheet name error: too long");
  CHECK(to_string(make_error(ErrorKind::kSprintNameConflict, "winter")) ==
        "There is already a sprint with name winter. Try renaming the sprint.");
  CHECK(to_string(make_error(ErrorKind::kStoreConnection, "locked")) ==
        "Failed to connect to SQLite database: locked");
  CHECK(to_string(make_error(ErrorKind::kConfigDeserialize, "bad")) ==
        "TOML deserialization error: bad");
  CHECK(to_string(make_error(ErrorKind::kConfigSerialize, "bad")) ==
        "TOML serialization error: bad");
  CHECK(to_string(make_error(ErrorKind::kUnknown, "plain")) == "plain");
  CHECK(to_string(make_error(ErrorKind::kXlsx, "zip")) == "XLSX write error: zip");
}

TEST_CASE("like_contains_pattern escapes wildcards and the escape character",
          "[core][normalization]") {
  CHECK(like_contains_pattern("abc") == "%abc%");
  CHECK(like_contains_pattern("50%_off\\") == "%50\\%\\_off\\\\%");
  CHECK(like_contains_pattern("") == "%%");
}

TEST_CASE("trim and normalize_ascii_upper are ASCII only", "[core][normalization]") {
  CHECK(trim("  Acme \t\n") == "Acme");
  CHECK(trim("   ").empty());
  CHECK(normalize_ascii_upper("passed") == "PASSED");
  CHECK(normalize_ascii_upper("caf\xc3\xa9") == "CAF\xc3\xa9");
}
