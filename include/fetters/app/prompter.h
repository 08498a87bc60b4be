#pragma once

#include "fetters/core/dates.h"
#include "fetters/core/error.h"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace fetters::app {

// IPrompter asks the user for input during a command flow.
//
// Every prompt returns nullopt when the user skips it (end of input or an
// explicit cancel). A skipped prompt ends the command with no changes.
// Failures of the underlying input channel are kPrompt errors.
class IPrompter {
 public:
  virtual ~IPrompter() = default;

  // Free text. An empty answer yields initial_value.
  [[nodiscard]] virtual core::FettersResult<std::optional<std::string>> text(
      const std::string& message, const std::string& initial_value = "") = 0;

  // Index of the chosen option.
  [[nodiscard]] virtual core::FettersResult<std::optional<std::size_t>> select(
      const std::string& message, const std::vector<std::string>& options) = 0;

  // Indices of the chosen options, ascending. May be empty.
  [[nodiscard]] virtual core::FettersResult<std::optional<std::vector<std::size_t>>> multi_select(
      const std::string& message, const std::vector<std::string>& options) = 0;

  [[nodiscard]] virtual core::FettersResult<std::optional<bool>> confirm(
      const std::string& message, bool default_value) = 0;

  // A calendar date; an empty answer yields starting_date.
  [[nodiscard]] virtual core::FettersResult<std::optional<core::CalendarDate>> date(
      const std::string& message, const core::CalendarDate& starting_date) = 0;

 protected:
  IPrompter() = default;
  IPrompter(const IPrompter&) = default;
  IPrompter& operator=(const IPrompter&) = default;
  IPrompter(IPrompter&&) = default;
  IPrompter& operator=(IPrompter&&) = default;
};

// ScriptedPrompter answers prompts from a fixed script, for tests and
// non-interactive runs. Each answer is consumed by the next prompt:
//   text         -> the answer itself ("" yields the initial value)
//   select       -> the exact label of an option
//   multi_select -> option labels joined by ", " ("" selects nothing)
//   confirm      -> "y" or "n"
//   date         -> YYYY-MM-DD ("" yields the starting date)
// A nullopt answer skips the prompt. Running out of answers, or an answer that
// does not fit the prompt, is a kPrompt error.
class ScriptedPrompter final : public IPrompter {
 public:
  explicit ScriptedPrompter(std::deque<std::optional<std::string>> answers)
      : answers_(std::move(answers)) {}

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

  // Messages of every prompt shown so far, in order.
  [[nodiscard]] const std::vector<std::string>& asked() const { return asked_; }
  [[nodiscard]] std::size_t remaining() const { return answers_.size(); }

 private:
  [[nodiscard]] core::FettersResult<std::optional<std::string>> next_answer(
      const std::string& message);

  std::deque<std::optional<std::string>> answers_;
  std::vector<std::string> asked_;
};

}  // namespace fetters::app
