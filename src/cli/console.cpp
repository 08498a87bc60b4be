#include "fetters/cli/console.h"

#include <unistd.h>

#include <cstdlib>

namespace fetters::cli {

namespace {

std::string_view color_code(Color color) {
  switch (color) {
    case Color::kRed:
      return "31";
    case Color::kGreen:
      return "32";
    case Color::kYellow:
      return "33";
    case Color::kBlue:
      return "34";
    case Color::kMagenta:
      return "35";
    case Color::kCyan:
      return "36";
    case Color::kWhite:
      return "37";
    case Color::kLightGray:
      return "38;2;201;201;201";
    case Color::kBrightRed:
      return "91";
    case Color::kBrightGreen:
      return "92";
    case Color::kBrightYellow:
      return "93";
    case Color::kBrightCyan:
      return "96";
    case Color::kDefault:
      break;
  }
  return {};
}

}  // namespace

bool stdout_supports_color() {
  const char* no_color = std::getenv("NO_COLOR");
  if (no_color != nullptr && *no_color != '\0') {
    return false;
  }
  return isatty(STDOUT_FILENO) == 1;
}

std::string paint(const Console& console, std::string_view text, Color color, bool bold) {
  const std::string_view code = color_code(color);
  if (!console.color || (code.empty() && !bold)) {
    return std::string{text};
  }

  std::string styled = "\x1b[";
  if (bold) {
    styled += "1";
    if (!code.empty()) {
      styled += ";";
    }
  }
  styled += code;
  styled += "m";
  styled += text;
  styled += "\x1b[0m";
  return styled;
}

Color job_status_color(std::string_view status) {
  if (status == "GHOSTED") {
    return Color::kWhite;
  }
  if (status == "HIRED") {
    return Color::kGreen;
  }
  if (status == "IN PROGRESS") {
    return Color::kYellow;
  }
  if (status == "NOT HIRING ANYMORE") {
    return Color::kLightGray;
  }
  if (status == "OFFER RECEIVED") {
    return Color::kMagenta;
  }
  if (status == "PENDING") {
    return Color::kBlue;
  }
  if (status == "REJECTED") {
    return Color::kRed;
  }
  return Color::kDefault;
}

Color stage_status_color(domain::StageStatus status) {
  switch (status) {
    case domain::StageStatus::kScheduled:
      return Color::kBrightYellow;
    case domain::StageStatus::kPassed:
      return Color::kBrightGreen;
    case domain::StageStatus::kRejected:
      return Color::kBrightRed;
  }
  return Color::kDefault;
}

void print_success(const Console& console, std::string_view message) {
  console.out << "\n" << paint(console, message, Color::kGreen, true) << "\n\n";
}

void print_notice(const Console& console, std::string_view message) {
  console.out << "\n" << paint(console, message, Color::kYellow, true) << "\n\n";
}

void print_cancelled(const Console& console) {
  console.out << paint(console, "Cancelled.", Color::kRed, true) << "\n";
}

}  // namespace fetters::cli
