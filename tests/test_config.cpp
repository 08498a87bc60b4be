#include "fetters/config/config_store.h"
#include "fetters/config/paths.h"
#include "fetters/config/toml.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

using namespace fetters::config;
using fetters::core::ErrorKind;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const char* name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Fresh scratch directory under the system temp dir, removed on destruction.
struct TempDir {
  std::filesystem::path path;

  explicit TempDir(const std::string& name)
      : path(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

}  // namespace

TEST_CASE("parse_toml reads root keys, tables and comments", "[config][toml]") {
  const std::string text =
      "# fetters settings\n"
      "current_sprint_name = \"sprint_2\"  # active\n"
      "\n"
      "retries = 3\n"
      "[ui]\n"
      "color = true\n"
      "'quoted key' = 'C:\\path'\n";

  auto document = parse_toml(text);
  REQUIRE(document.has_value());
  const auto& doc = document.value();

  CHECK(doc.get_string("current_sprint_name") == "sprint_2");
  CHECK(doc.get_string("ui.quoted key") == "C:\\path");
  REQUIRE(doc.find("retries") != nullptr);
  CHECK(doc.find("retries")->kind == TomlValue::Kind::kLiteral);
  CHECK(doc.find("retries")->text == "3");
  CHECK(doc.find("ui.color")->text == "true");
  CHECK_FALSE(doc.get_string("retries").has_value());
  CHECK(doc.find("missing") == nullptr);
  CHECK(doc.entries().size() == 4);
}

TEST_CASE("parse_toml decodes escapes", "[config][toml]") {
  auto document = parse_toml("name = \"tab\\there \\\"q\\\" \\u00e9\"\n");
  REQUIRE(document.has_value());
  CHECK(document.value().get_string("name") == "tab\there \"q\" \xC3\xA9");
}

TEST_CASE("parse_toml reports malformed lines", "[config][toml]") {
  for (const std::string bad : {
           std::string{"name = \"open\n"},
           std::string{"name\n"},
           std::string{"name = soon\n"},
           std::string{"a.b = 1\n"},
           std::string{"[[servers]]\n"},
           std::string{"[ui\n"},
           std::string{"name = 1 extra\n"},
           std::string{"name = \"\\q\"\n"},
           std::string{"name = 1\nname = 2\n"},
           std::string{"[ui]\n[ui]\n"},
           std::string{"n = 01\n"},
       }) {
    auto document = parse_toml(bad);
    REQUIRE_FALSE(document.has_value());
    CHECK(document.error().kind == ErrorKind::kConfigDeserialize);
  }

  auto document = parse_toml("\n\nname = \n");
  REQUIRE_FALSE(document.has_value());
  CHECK(document.error().message == "missing value at line 3");
}

TEST_CASE("serialize_toml writes root keys before tables", "[config][toml]") {
  TomlDocument doc;
  doc.add(TomlEntry{"ui", "color", TomlValue{TomlValue::Kind::kLiteral, "true"}});
  doc.set_string("current_sprint_name", "sprint \"1\"");
  doc.add(TomlEntry{"", "retries", TomlValue{TomlValue::Kind::kLiteral, "1_000"}});
  doc.set_string("ui.theme name", "dark");

  auto text = serialize_toml(doc);
  REQUIRE(text.has_value());
  CHECK(text.value() ==
        "current_sprint_name = \"sprint \\\"1\\\"\"\n"
        "retries = 1_000\n"
        "\n"
        "[ui]\n"
        "color = true\n"
        "\"theme name\" = \"dark\"\n");

  auto reparsed = parse_toml(text.value());
  REQUIRE(reparsed.has_value());
  CHECK(reparsed.value().get_string("current_sprint_name") == "sprint \"1\"");
  CHECK(reparsed.value().get_string("ui.theme name") == "dark");
}

TEST_CASE("serialize_toml rejects invalid entries", "[config][toml]") {
  TomlDocument empty_key;
  empty_key.add(TomlEntry{"", "", TomlValue{TomlValue::Kind::kString, "x"}});
  auto first = serialize_toml(empty_key);
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().kind == ErrorKind::kConfigSerialize);

  TomlDocument bad_literal;
  bad_literal.add(TomlEntry{"", "n", TomlValue{TomlValue::Kind::kLiteral, "1__0"}});
  auto second = serialize_toml(bad_literal);
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().kind == ErrorKind::kConfigSerialize);
}

TEST_CASE("set_string replaces in place", "[config][toml]") {
  auto document = parse_toml("a = \"1\"\nb = \"2\"\n");
  REQUIRE(document.has_value());
  document.value().set_string("a", "3");
  REQUIRE(document.value().entries().size() == 2);
  CHECK(document.value().entries()[0].key == "a");
  CHECK(document.value().get_string("a") == "3");
}

TEST_CASE("FileConfigStore loads defaults from a missing file", "[config][store]") {
  TempDir dir("fetters_test_config_missing");
  FileConfigStore store(dir.path / "fetters.toml");

  auto config = store.load();
  REQUIRE(config.has_value());
  CHECK(config.value().current_sprint_name.empty());

  auto text = store.read_text();
  REQUIRE(text.has_value());
  CHECK(text.value().empty());
}

TEST_CASE("FileConfigStore saves and reloads the current sprint", "[config][store]") {
  TempDir dir("fetters_test_config_save");
  FileConfigStore store(dir.path / "fetters.toml");

  REQUIRE(store.save(FettersConfig{"sprint_3"}).has_value());
  CHECK(read_file(store.path()) == "current_sprint_name = \"sprint_3\"\n");
  CHECK_FALSE(std::filesystem::exists(dir.path / "fetters.toml.tmp"));

  auto config = store.load();
  REQUIRE(config.has_value());
  CHECK(config.value() == FettersConfig{"sprint_3"});
}

TEST_CASE("FileConfigStore preserves unknown keys", "[config][store]") {
  TempDir dir("fetters_test_config_preserve");
  const auto path = dir.path / "fetters.toml";
  {
    std::ofstream out(path);
    out << "# mine\neditor = \"nano\"\ncurrent_sprint_name = \"old\"\n[extra]\nlevel = 2\n";
  }

  FileConfigStore store(path);
  REQUIRE(store.save(FettersConfig{"new"}).has_value());

  auto document = parse_toml(read_file(path));
  REQUIRE(document.has_value());
  CHECK(document.value().get_string("editor") == "nano");
  CHECK(document.value().get_string("current_sprint_name") == "new");
  REQUIRE(document.value().find("extra.level") != nullptr);
  CHECK(document.value().find("extra.level")->text == "2");
}

TEST_CASE("FileConfigStore surfaces parse errors", "[config][store]") {
  TempDir dir("fetters_test_config_broken");
  const auto path = dir.path / "fetters.toml";
  {
    std::ofstream out(path);
    out << "current_sprint_name = \n";
  }

  FileConfigStore store(path);
  auto config = store.load();
  REQUIRE_FALSE(config.has_value());
  CHECK(config.error().kind == ErrorKind::kConfigDeserialize);

  auto saved = store.save(FettersConfig{"x"});
  REQUIRE_FALSE(saved.has_value());
  CHECK(saved.error().kind == ErrorKind::kConfigDeserialize);
}

TEST_CASE("config_from_document ignores non-string sprint values", "[config][store]") {
  auto document = parse_toml("current_sprint_name = 5\n");
  REQUIRE(document.has_value());
  CHECK(config_from_document(document.value()).current_sprint_name.empty());
}

TEST_CASE("InMemoryConfigStore round-trips", "[config][store]") {
  InMemoryConfigStore store(FettersConfig{"a"});
  CHECK(store.load().value().current_sprint_name == "a");
  REQUIRE(store.save(FettersConfig{"b"}).has_value());
  CHECK(store.load().value().current_sprint_name == "b");
}

TEST_CASE("resolve_app_paths prefers explicit overrides", "[config][paths]") {
  auto paths = resolve_app_paths(fake_env({{"FETTERS_DB", "/tmp/x/jobs.db"},
                                           {"FETTERS_CONFIG", "/tmp/y/conf.toml"},
                                           {"HOME", "/home/u"}}));
  REQUIRE(paths.has_value());
  CHECK(paths.value().database_file == std::filesystem::path{"/tmp/x/jobs.db"});
  CHECK(paths.value().data_dir == std::filesystem::path{"/tmp/x"});
  CHECK(paths.value().config_file == std::filesystem::path{"/tmp/y/conf.toml"});
  CHECK(paths.value().config_dir == std::filesystem::path{"/tmp/y"});
}

TEST_CASE("resolve_app_paths follows XDG then HOME", "[config][paths]") {
  auto xdg = resolve_app_paths(fake_env(
      {{"XDG_DATA_HOME", "/xdg/data"}, {"XDG_CONFIG_HOME", "/xdg/conf"}, {"HOME", "/home/u"}}));
  REQUIRE(xdg.has_value());
  CHECK(xdg.value().database_file == std::filesystem::path{"/xdg/data/fetters/fetters.db"});
  CHECK(xdg.value().config_file == std::filesystem::path{"/xdg/conf/fetters/fetters.toml"});

  auto home = resolve_app_paths(fake_env({{"HOME", "/home/u"}}));
  REQUIRE(home.has_value());
  CHECK(home.value().database_file ==
        std::filesystem::path{"/home/u/.local/share/fetters/fetters.db"});
  CHECK(home.value().config_file == std::filesystem::path{"/home/u/.config/fetters/fetters.toml"});
}

TEST_CASE("resolve_app_paths fails without a home", "[config][paths]") {
  auto paths = resolve_app_paths(fake_env({}));
  REQUIRE_FALSE(paths.has_value());
  CHECK(paths.error().kind == ErrorKind::kApplicationDirUnavailable);
}

TEST_CASE("ensure_app_dirs creates parent directories", "[config][paths]") {
  TempDir dir("fetters_test_app_dirs");
  AppPaths paths;
  paths.database_file = dir.path / "data" / "fetters" / "fetters.db";
  paths.config_file = dir.path / "conf" / "fetters" / "fetters.toml";

  REQUIRE(ensure_app_dirs(paths).has_value());
  CHECK(std::filesystem::is_directory(dir.path / "data" / "fetters"));
  CHECK(std::filesystem::is_directory(dir.path / "conf" / "fetters"));
}
