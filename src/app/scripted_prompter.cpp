#include "fetters/app/prompter.h"

#include "fetters/core/normalization.h"

#include <algorithm>
#include <string_view>

namespace fetters::app {

namespace {

core::Error prompt_error(const std::string& message, const std::string& detail) {
  return core::make_error(core::ErrorKind::kPrompt, detail + " for prompt '" + message + "'");
}

std::optional<std::size_t> find_option(const std::vector<std::string>& options,
                                       const std::string& label) {
  for (std::size_t i = 0; i < options.size(); ++i) {
    if (options[i] == label) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace

core::FettersResult<std::optional<std::string>> ScriptedPrompter::next_answer(
    const std::string& message) {
  using ResultType = core::FettersResult<std::optional<std::string>>;

  asked_.push_back(message);
  if (answers_.empty()) {
    return ResultType::err(prompt_error(message, "no scripted answer"));
  }
  auto answer = std::move(answers_.front());
  answers_.pop_front();
  return ResultType::ok(std::move(answer));
}

core::FettersResult<std::optional<std::string>> ScriptedPrompter::text(
    const std::string& message, const std::string& initial_value) {
  auto answer = next_answer(message);
  // Trimmed like a terminal line, so a blank answer keeps the initial value.
  if (answer.has_value() && answer.value().has_value()) {
    answer.value() = core::trim(answer.value().value());
    if (answer.value()->empty()) {
      answer.value() = initial_value;
    }
  }
  return answer;
}

core::FettersResult<std::optional<std::size_t>> ScriptedPrompter::select(
    const std::string& message, const std::vector<std::string>& options) {
  using ResultType = core::FettersResult<std::optional<std::size_t>>;

  auto answer = next_answer(message);
  if (!answer.has_value()) {
    return ResultType::err(answer.error());
  }
  if (!answer.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }

  auto index = find_option(options, answer.value().value());
  if (!index.has_value()) {
    return ResultType::err(prompt_error(message, "unknown option '" + *answer.value() + "'"));
  }
  return ResultType::ok(index);
}

core::FettersResult<std::optional<std::vector<std::size_t>>> ScriptedPrompter::multi_select(
    const std::string& message, const std::vector<std::string>& options) {
  using ResultType = core::FettersResult<std::optional<std::vector<std::size_t>>>;

  auto answer = next_answer(message);
  if (!answer.has_value()) {
    return ResultType::err(answer.error());
  }
  if (!answer.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }

  std::vector<std::size_t> chosen;
  std::string_view rest = answer.value().value();
  while (!rest.empty()) {
    const auto comma = rest.find(", ");
    const std::string label{rest.substr(0, comma)};
    rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 2);

    auto index = find_option(options, label);
    if (!index.has_value()) {
      return ResultType::err(prompt_error(message, "unknown option '" + label + "'"));
    }
    chosen.push_back(index.value());
  }
  std::sort(chosen.begin(), chosen.end());
  return ResultType::ok(std::move(chosen));
}

core::FettersResult<std::optional<bool>> ScriptedPrompter::confirm(const std::string& message,
                                                                   bool default_value) {
  using ResultType = core::FettersResult<std::optional<bool>>;

  auto answer = next_answer(message);
  if (!answer.has_value()) {
    return ResultType::err(answer.error());
  }
  if (!answer.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }

  const std::string& reply = answer.value().value();
  if (reply.empty()) {
    return ResultType::ok(default_value);
  }
  if (reply == "y") {
    return ResultType::ok(true);
  }
  if (reply == "n") {
    return ResultType::ok(false);
  }
  return ResultType::err(prompt_error(message, "expected y or n, got '" + reply + "'"));
}

core::FettersResult<std::optional<core::CalendarDate>> ScriptedPrompter::date(
    const std::string& message, const core::CalendarDate& starting_date) {
  using ResultType = core::FettersResult<std::optional<core::CalendarDate>>;

  auto answer = next_answer(message);
  if (!answer.has_value()) {
    return ResultType::err(answer.error());
  }
  if (!answer.value().has_value()) {
    return ResultType::ok(std::nullopt);
  }

  const std::string& reply = answer.value().value();
  if (reply.empty()) {
    return ResultType::ok(starting_date);
  }
  auto parsed = core::parse_date(reply, core::kIsoDateSeparator);
  if (!parsed.has_value()) {
    return ResultType::err(prompt_error(message, "invalid date '" + reply + "'"));
  }
  return ResultType::ok(parsed);
}

}  // namespace fetters::app
