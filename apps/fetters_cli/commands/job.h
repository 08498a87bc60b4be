#pragma once

// Job application subcommands. Every subcommand but add takes the query flags
// from query_args.h.
// Usage: fetters add <company>
//        fetters list [query flags] [--json]
//        fetters update [query flags]
//        fetters delete [query flags]
//        fetters open [query flags]
int cmd_add(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_list(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_update(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_delete(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_open(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
