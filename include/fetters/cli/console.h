#pragma once

#include "fetters/domain/stage.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace fetters::cli {

enum class Color {
  kDefault,
  kRed,
  kGreen,
  kYellow,
  kBlue,
  kMagenta,
  kCyan,
  kWhite,
  kLightGray,
  kBrightRed,
  kBrightGreen,
  kBrightYellow,
  kBrightCyan,
};

// Console is the output side of a command: the stream results go to and
// whether ANSI styling is applied.
struct Console {
  std::ostream& out;
  bool color{false};
};

// True unless NO_COLOR is set or stdout is not a terminal.
[[nodiscard]] bool stdout_supports_color();

// Wrap text in ANSI escapes when console.color is set; otherwise return it as is.
[[nodiscard]] std::string paint(const Console& console, std::string_view text, Color color,
                                bool bold = false);

// Terminal color for a job application status (table rows, job choices).
[[nodiscard]] Color job_status_color(std::string_view status);

[[nodiscard]] Color stage_status_color(domain::StageStatus status);

// Bold status messages used at the end of command flows.
void print_success(const Console& console, std::string_view message);
void print_notice(const Console& console, std::string_view message);
void print_cancelled(const Console& console);

}  // namespace fetters::cli
