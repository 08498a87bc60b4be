#pragma once

#include "fetters/core/error.h"

#include <string>
#include <vector>

// Run argv[0] (looked up on PATH) with the given arguments, wait for it and
// return its exit status. kIo when the process cannot be started.
[[nodiscard]] fetters::core::FettersResult<int> run_process(const std::vector<std::string>& args);

// Hand a link or file path to the platform opener (xdg-open, or open on macOS).
[[nodiscard]] fetters::core::FettersResult<bool> open_link(const std::string& link);
