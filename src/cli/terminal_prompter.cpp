#include "fetters/cli/terminal_prompter.h"

#include "fetters/core/normalization.h"

#include <algorithm>
#include <charconv>
#include <string>

namespace fetters::cli {

namespace {

std::optional<std::size_t> parse_index(std::string_view token, std::size_t option_count) {
  std::size_t number = 0;
  const auto* end = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), end, number);
  if (ec != std::errc{} || ptr != end || number == 0 || number > option_count) {
    return std::nullopt;
  }
  return number - 1;
}

}  // namespace

core::FettersResult<std::optional<std::string>> TerminalPrompter::read_line() {
  using ResultType = core::FettersResult<std::optional<std::string>>;

  std::string line;
  if (std::getline(in_, line)) {
    return ResultType::ok(core::trim(line));
  }
  if (in_.eof()) {
    console_.out << "\n";
    return ResultType::ok(std::nullopt);
  }
  return ResultType::err(core::make_error(core::ErrorKind::kPrompt, "failed to read from stdin"));
}

void TerminalPrompter::ask(const std::string& message, const std::string& hint) {
  console_.out << paint(console_, "?", Color::kGreen, true) << " "
               << paint(console_, message, Color::kDefault, true);
  if (!hint.empty()) {
    console_.out << " " << paint(console_, "(" + hint + ")", Color::kCyan);
  }
  console_.out << " " << std::flush;
}

void TerminalPrompter::print_options(const std::vector<std::string>& options) {
  for (std::size_t i = 0; i < options.size(); ++i) {
    console_.out << "  " << paint(console_, std::to_string(i + 1) + ")", Color::kCyan) << " "
                 << options[i] << "\n";
  }
}

void TerminalPrompter::warn(const std::string& message) {
  console_.out << paint(console_, message, Color::kRed, true) << "\n";
}

core::FettersResult<std::optional<std::string>> TerminalPrompter::text(
    const std::string& message, const std::string& initial_value) {
  ask(message, initial_value);
  auto line = read_line();
  if (line.has_value() && line.value().has_value() && line.value()->empty()) {
    line.value() = initial_value;
  }
  return line;
}

core::FettersResult<std::optional<std::size_t>> TerminalPrompter::select(
    const std::string& message, const std::vector<std::string>& options) {
  using ResultType = core::FettersResult<std::optional<std::size_t>>;

  if (options.empty()) {
    return ResultType::err(
        core::make_error(core::ErrorKind::kPrompt, "no options for '" + message + "'"));
  }

  console_.out << "\n";
  print_options(options);
  while (true) {
    ask(message, "1-" + std::to_string(options.size()));
    auto line = read_line();
    if (!line.has_value()) {
      return ResultType::err(line.error());
    }
    if (!line.value().has_value() || line.value()->empty()) {
      return ResultType::ok(std::nullopt);
    }
    auto index = parse_index(line.value().value(), options.size());
    if (index.has_value()) {
      return ResultType::ok(index);
    }
    warn("Enter a number between 1 and " + std::to_string(options.size()) + ".");
  }
}

core::FettersResult<std::optional<std::vector<std::size_t>>> TerminalPrompter::multi_select(
    const std::string& message, const std::vector<std::string>& options) {
  using ResultType = core::FettersResult<std::optional<std::vector<std::size_t>>>;

  console_.out << "\n";
  print_options(options);
  while (true) {
    ask(message, "numbers separated by commas");
    auto line = read_line();
    if (!line.has_value()) {
      return ResultType::err(line.error());
    }
    if (!line.value().has_value()) {
      return ResultType::ok(std::nullopt);
    }

    std::string normalized = line.value().value();
    std::replace(normalized.begin(), normalized.end(), ',', ' ');

    std::vector<std::size_t> chosen;
    bool valid = true;
    std::string_view rest = normalized;
    while (!rest.empty()) {
      const auto start = rest.find_first_not_of(' ');
      if (start == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(start);
      const auto stop = rest.find(' ');
      const std::string_view token = rest.substr(0, stop);
      rest = stop == std::string_view::npos ? std::string_view{} : rest.substr(stop);

      auto index = parse_index(token, options.size());
      if (!index.has_value()) {
        valid = false;
        break;
      }
      if (std::find(chosen.begin(), chosen.end(), index.value()) == chosen.end()) {
        chosen.push_back(index.value());
      }
    }

    if (valid) {
      std::sort(chosen.begin(), chosen.end());
      return ResultType::ok(std::move(chosen));
    }
    warn("Enter numbers between 1 and " + std::to_string(options.size()) + ".");
  }
}

core::FettersResult<std::optional<bool>> TerminalPrompter::confirm(const std::string& message,
                                                                   bool default_value) {
  using ResultType = core::FettersResult<std::optional<bool>>;

  while (true) {
    ask(message, default_value ? "Y/n" : "y/N");
    auto line = read_line();
    if (!line.has_value()) {
      return ResultType::err(line.error());
    }
    if (!line.value().has_value()) {
      return ResultType::ok(std::nullopt);
    }

    const std::string answer = core::normalize_ascii_upper(line.value().value());
    if (answer.empty()) {
      return ResultType::ok(default_value);
    }
    if (answer == "Y" || answer == "YES") {
      return ResultType::ok(true);
    }
    if (answer == "N" || answer == "NO") {
      return ResultType::ok(false);
    }
    warn("Answer y or n.");
  }
}

core::FettersResult<std::optional<core::CalendarDate>> TerminalPrompter::date(
    const std::string& message, const core::CalendarDate& starting_date) {
  using ResultType = core::FettersResult<std::optional<core::CalendarDate>>;

  const std::string starting_text = core::format_date(starting_date, core::kIsoDateSeparator);
  while (true) {
    ask(message, starting_text);
    auto line = read_line();
    if (!line.has_value()) {
      return ResultType::err(line.error());
    }
    if (!line.value().has_value()) {
      return ResultType::ok(std::nullopt);
    }
    if (line.value()->empty()) {
      return ResultType::ok(starting_date);
    }

    auto parsed = core::parse_date(line.value().value(), core::kIsoDateSeparator);
    if (parsed.has_value()) {
      return ResultType::ok(parsed);
    }
    warn("Enter a valid date as YYYY-MM-DD.");
  }
}

}  // namespace fetters::cli
