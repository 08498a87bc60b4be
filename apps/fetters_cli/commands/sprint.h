#pragma once

// cmd_sprint: manage job sprints.
// Usage: fetters sprint current
//        fetters sprint new [-n|--name <name>]
//        fetters sprint show-all [--json]
//        fetters sprint set
int cmd_sprint(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
