#pragma once

// cmd_export: write a sprint's job applications to an XLSX spreadsheet.
// Usage: fetters export [-d|--directory <dir>] [-f|--filename <name>] [-s|--sprint <sprint>]
// cmd_insights: job counts per status and per sprint.
// Usage: fetters insights [--json]
int cmd_export(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_insights(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
