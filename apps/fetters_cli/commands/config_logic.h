#pragma once

#include "fetters/config/config_store.h"
#include "fetters/config/paths.h"

#include <ostream>
#include <string>

// execute_config_show: print the config document, or a note when it is empty.
// execute_config_edit: make sure the file exists, then open it in the editor.
// Both read the raw document, so they work on the file store directly.
int execute_config_show(const fetters::config::FileConfigStore& store, std::ostream& out);
int execute_config_edit(fetters::config::FileConfigStore& store,
                        const fetters::config::EnvLookup& env);

// $VISUAL, else $EDITOR, else vi.
[[nodiscard]] std::string resolve_editor(const fetters::config::EnvLookup& env);
