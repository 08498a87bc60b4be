#include "fetters/config/config_store.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fetters::config {

namespace {

core::Error io_error(const std::string& action, const std::filesystem::path& path) {
  return core::make_error(core::ErrorKind::kIo, "cannot " + action + " " + path.string());
}

}  // namespace

FettersConfig config_from_document(const TomlDocument& document) {
  FettersConfig config;
  config.current_sprint_name = document.get_string(kCurrentSprintKey).value_or("");
  return config;
}

FileConfigStore::FileConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

core::FettersResult<std::string> FileConfigStore::read_text() const {
  using ResultType = core::FettersResult<std::string>;

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return ResultType::ok("");
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return ResultType::err(io_error("open", path_));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return ResultType::err(io_error("read", path_));
  }
  return ResultType::ok(buffer.str());
}

core::FettersResult<TomlDocument> FileConfigStore::load_document() const {
  auto text = read_text();
  if (!text.has_value()) {
    return core::FettersResult<TomlDocument>::err(text.error());
  }
  return parse_toml(text.value());
}

core::FettersResult<FettersConfig> FileConfigStore::load() const {
  auto document = load_document();
  if (!document.has_value()) {
    return core::FettersResult<FettersConfig>::err(document.error());
  }
  return core::FettersResult<FettersConfig>::ok(config_from_document(document.value()));
}

core::FettersResult<bool> FileConfigStore::save(const FettersConfig& config) {
  using ResultType = core::FettersResult<bool>;

  auto document = load_document();
  if (!document.has_value()) {
    return ResultType::err(document.error());
  }
  document.value().set_string(kCurrentSprintKey, config.current_sprint_name);

  auto text = serialize_toml(document.value());
  if (!text.has_value()) {
    return ResultType::err(text.error());
  }

  // Write a sibling file and rename it over the original.
  std::filesystem::path temp_path = path_;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return ResultType::err(io_error("write", temp_path));
    }
    out << text.value();
    out.flush();
    if (!out) {
      return ResultType::err(io_error("write", temp_path));
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path_, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return ResultType::err(io_error("replace", path_));
  }
  return ResultType::ok(true);
}

core::FettersResult<FettersConfig> InMemoryConfigStore::load() const {
  return core::FettersResult<FettersConfig>::ok(config_);
}

core::FettersResult<bool> InMemoryConfigStore::save(const FettersConfig& config) {
  config_ = config;
  return core::FettersResult<bool>::ok(true);
}

}  // namespace fetters::config
