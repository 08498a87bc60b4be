#include "commands/config_logic.h"
#include "commands/query_args.h"
#include "shared/arg_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using fetters::apps::Option;
using fetters::apps::ValueMode;

namespace {

// Owns argument strings and exposes them as a mutable argv.
struct Argv {
  std::vector<std::string> storage;
  std::vector<char*> pointers;

  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& arg : storage) {
      pointers.push_back(arg.data());
    }
    pointers.push_back(nullptr);
  }

  [[nodiscard]] int argc() const { return static_cast<int>(storage.size()); }
  [[nodiscard]] char** argv() { return pointers.data(); }
};

struct SampleConfig {
  bool json{false};
  std::string name;
  std::string level{"unset"};
};

std::vector<Option<SampleConfig>> sample_options() {
  return {
      {"--json", "", ValueMode::kNone, "Print JSON",
       [](SampleConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--name", "-n", ValueMode::kRequired, "Name",
       [](SampleConfig& c, const std::string& v) {
         c.name = v;
         return !v.empty();
       }},
      {"--level", "", ValueMode::kOptional, "Level",
       [](SampleConfig& c, const std::string& v) {
         c.level = v;
         return true;
       }},
  };
}

fetters::config::EnvLookup fake_env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const char* name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

}  // namespace

TEST_CASE("parse_options dispatches flags and keeps positionals", "[apps][args]") {
  Argv args({"fetters", "sprint", "new", "-n", "sprint_2", "--json", "extra"});
  auto parsed = fetters::apps::parse_options(args.argc(), args.argv(), sample_options());

  CHECK(parsed.valid);
  CHECK(parsed.config.json);
  CHECK(parsed.config.name == "sprint_2");
  CHECK(parsed.positionals == std::vector<std::string>{"new", "extra"});
}

TEST_CASE("parse_options accepts inline values", "[apps][args]") {
  Argv args({"fetters", "x", "--name=a=b", "--level=3"});
  auto parsed = fetters::apps::parse_options(args.argc(), args.argv(), sample_options());

  CHECK(parsed.valid);
  CHECK(parsed.config.name == "a=b");
  CHECK(parsed.config.level == "3");
}

TEST_CASE("parse_options optional values do not swallow flags", "[apps][args]") {
  Argv args({"fetters", "x", "--level", "--json"});
  auto parsed = fetters::apps::parse_options(args.argc(), args.argv(), sample_options());

  CHECK(parsed.valid);
  CHECK(parsed.config.level.empty());
  CHECK(parsed.config.json);
}

TEST_CASE("parse_options flags invalid input", "[apps][args]") {
  SECTION("unknown flag") {
    Argv args({"fetters", "x", "--bogus"});
    CHECK_FALSE(fetters::apps::parse_options(args.argc(), args.argv(), sample_options()).valid);
  }
  SECTION("missing value") {
    Argv args({"fetters", "x", "--name"});
    CHECK_FALSE(fetters::apps::parse_options(args.argc(), args.argv(), sample_options()).valid);
  }
  SECTION("value on a switch") {
    Argv args({"fetters", "x", "--json=yes"});
    CHECK_FALSE(fetters::apps::parse_options(args.argc(), args.argv(), sample_options()).valid);
  }
  SECTION("handler rejects") {
    Argv args({"fetters", "x", "--name", ""});
    CHECK_FALSE(fetters::apps::parse_options(args.argc(), args.argv(), sample_options()).valid);
  }
}

TEST_CASE("format_options aligns descriptions", "[apps][args]") {
  const std::string help = fetters::apps::format_options(sample_options());
  CHECK(help.find("      --json                Print JSON\n") != std::string::npos);
  CHECK(help.find("  -n, --name <value>        Name\n") != std::string::npos);
  CHECK(help.find("      --level [value]       Level\n") != std::string::npos);
}

TEST_CASE("parse_query_args builds a job filter", "[apps][args]") {
  Argv args({"fetters", "list", "-c", "acme", "--sprint", "sprint_1", "-s", "pend", "-t", "eng",
             "-l", "http", "-n", "remote", "--stages", "2"});
  auto filter = parse_query_args(args.argc(), args.argv(), 2, "fetters list");

  REQUIRE(filter.has_value());
  CHECK(filter->company == "acme");
  CHECK(filter->sprint == "sprint_1");
  CHECK(filter->status == "pend");
  CHECK(filter->title == "eng");
  CHECK(filter->link == "http");
  CHECK(filter->notes == "remote");
  CHECK(filter->stages == std::optional<std::int64_t>{2});
}

TEST_CASE("parse_query_args treats a bare --stages as any stages", "[apps][args]") {
  Argv args({"fetters", "stage", "tree", "--stages", "-c", "acme"});
  auto filter = parse_query_args(args.argc(), args.argv(), 3, "fetters stage tree");

  REQUIRE(filter.has_value());
  CHECK(filter->stages == std::optional<std::int64_t>{0});
  CHECK(filter->company == "acme");
}

TEST_CASE("parse_query_args rejects bad input", "[apps][args]") {
  SECTION("negative stages") {
    Argv args({"fetters", "list", "--stages=-1"});
    CHECK_FALSE(parse_query_args(args.argc(), args.argv(), 2, "fetters list").has_value());
  }
  SECTION("stray positional") {
    Argv args({"fetters", "list", "acme"});
    CHECK_FALSE(parse_query_args(args.argc(), args.argv(), 2, "fetters list").has_value());
  }
}

TEST_CASE("resolve_editor prefers VISUAL then EDITOR", "[apps][config]") {
  CHECK(resolve_editor(fake_env({{"VISUAL", "code -w"}, {"EDITOR", "nano"}})) == "code -w");
  CHECK(resolve_editor(fake_env({{"EDITOR", "nano"}})) == "nano");
  CHECK(resolve_editor(fake_env({})) == "vi");
}

TEST_CASE("execute_config_show prints the document or a note", "[apps][config]") {
  const auto dir = std::filesystem::temp_directory_path() / "fetters_test_config_show";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  fetters::config::FileConfigStore store(dir / "fetters.toml");

  std::ostringstream empty;
  CHECK(execute_config_show(store, empty) == 0);
  CHECK(empty.str() == "No settings saved yet in " + (dir / "fetters.toml").string() + "\n");

  {
    std::ofstream out(dir / "fetters.toml");
    out << "current_sprint_name = \"sprint_1\"";
  }
  std::ostringstream shown;
  CHECK(execute_config_show(store, shown) == 0);
  CHECK(shown.str() == "current_sprint_name = \"sprint_1\"\n");

  std::filesystem::remove_all(dir);
}

TEST_CASE("execute_config_edit creates the file and validates it", "[apps][config]") {
  const auto dir = std::filesystem::temp_directory_path() / "fetters_test_config_edit";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  fetters::config::FileConfigStore store(dir / "fetters.toml");

  // "true" stands in for an editor that saves without changes.
  CHECK(execute_config_edit(store, fake_env({{"EDITOR", "true"}})) == 0);
  CHECK(std::filesystem::exists(store.path()));

  CHECK(execute_config_edit(store, fake_env({{"EDITOR", "false"}})) == 1);

  std::filesystem::remove_all(dir);
}
