#pragma once

#include "fetters/domain/job.h"

#include "shared/arg_parser.h"
#include <optional>
#include <vector>

// Flags shared by every subcommand that selects job applications:
//   -c/--company, -l/--link, -n/--notes, --sprint, -s/--status, -t/--title
// are substring filters; --stages [N] keeps jobs with any stages (no value)
// or exactly N stages.
[[nodiscard]] std::vector<fetters::apps::Option<fetters::domain::JobFilter>> query_options();

// Parse the query flags of `fetters <command> [<subcommand>] ...` starting at argv[start].
// Prints usage to stderr and returns nullopt on invalid flags or stray arguments.
[[nodiscard]] std::optional<fetters::domain::JobFilter> parse_query_args(
    int argc, char* argv[], int start, const char* usage);  // NOLINT(modernize-avoid-c-arrays)
