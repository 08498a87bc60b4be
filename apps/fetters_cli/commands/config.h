#pragma once

// cmd_config: show or edit the config file.
// Usage: fetters config show
//        fetters config edit
int cmd_config(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
