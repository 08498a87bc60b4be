#pragma once

#include "fetters/app/prompter.h"
#include "fetters/app/services.h"
#include "fetters/cli/console.h"

namespace fetters::app {

// Everything a command flow talks to: the stores, the user, and the output.
//
// Flows return FettersResult<bool>: true when the command ran to completion,
// false when the user skipped a prompt or declined a confirmation (no changes).
struct CommandContext {
  Services& services;
  IPrompter& prompter;
  const cli::Console& console;
};

}  // namespace fetters::app
