#pragma once

#include <string_view>

// ASCII art printed by `fetters banner`.
[[nodiscard]] std::string_view banner_text();

int cmd_banner(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
