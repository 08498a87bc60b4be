#pragma once

// cmd_stage: manage the interview stages of one job application.
// Usage: fetters stage add|delete|tree|update [query flags]
int cmd_stage(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
