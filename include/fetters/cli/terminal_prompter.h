#pragma once

#include "fetters/app/prompter.h"
#include "fetters/cli/console.h"

#include <istream>

namespace fetters::cli {

// TerminalPrompter asks on the console and reads line-based answers.
//   select:       the number of an option
//   multi_select: numbers separated by commas or spaces ("" selects nothing)
//   confirm:      y/yes or n/no, "" takes the default
//   date:         YYYY-MM-DD, "" takes the starting date
// Invalid answers are reported and asked again. End of input skips the prompt.
class TerminalPrompter final : public app::IPrompter {
 public:
  TerminalPrompter(std::istream& in, const Console& console) : in_(in), console_(console) {}

  [[nodiscard]] core::FettersResult<std::optional<std::string>> text(
      const std::string& message, const std::string& initial_value = "") override;
  [[nodiscard]] core::FettersResult<std::optional<std::size_t>> select(
      const std::string& message, const std::vector<std::string>& options) override;
  [[nodiscard]] core::FettersResult<std::optional<std::vector<std::size_t>>> multi_select(
      const std::string& message, const std::vector<std::string>& options) override;
  [[nodiscard]] core::FettersResult<std::optional<bool>> confirm(const std::string& message,
                                                                 bool default_value) override;
  [[nodiscard]] core::FettersResult<std::optional<core::CalendarDate>> date(
      const std::string& message, const core::CalendarDate& starting_date) override;

 private:
  // nullopt at end of input; kPrompt error when the stream fails.
  [[nodiscard]] core::FettersResult<std::optional<std::string>> read_line();
  void ask(const std::string& message, const std::string& hint);
  void print_options(const std::vector<std::string>& options);
  void warn(const std::string& message);

  std::istream& in_;
  const Console& console_;
};

}  // namespace fetters::cli
