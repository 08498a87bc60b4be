#include "query_args.h"

#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>

using fetters::apps::Option;
using fetters::apps::ValueMode;
using fetters::domain::JobFilter;

std::vector<Option<JobFilter>> query_options() {
  return {
      {"--company", "-c", ValueMode::kRequired, "Filter by company name (partial text)",
       [](JobFilter& f, const std::string& v) {
         f.company = v;
         return true;
       }},
      {"--link", "-l", ValueMode::kRequired, "Filter by link (partial text)",
       [](JobFilter& f, const std::string& v) {
         f.link = v;
         return true;
       }},
      {"--notes", "-n", ValueMode::kRequired, "Filter by notes (partial text)",
       [](JobFilter& f, const std::string& v) {
         f.notes = v;
         return true;
       }},
      {"--sprint", "", ValueMode::kRequired, "Filter by sprint name (partial text)",
       [](JobFilter& f, const std::string& v) {
         f.sprint = v;
         return true;
       }},
      {"--status", "-s", ValueMode::kRequired, "Filter by application status (partial text)",
       [](JobFilter& f, const std::string& v) {
         f.status = v;
         return true;
       }},
      {"--title", "-t", ValueMode::kRequired, "Filter by job title (partial text)",
       [](JobFilter& f, const std::string& v) {
         f.title = v;
         return true;
       }},
      {"--stages", "", ValueMode::kOptional,
       "Jobs with any interview stages, or exactly N stages",
       [](JobFilter& f, const std::string& v) {
         if (v.empty()) {
           f.stages = 0;
           return true;
         }
         std::int64_t count = 0;
         const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), count);
         if (ec != std::errc{} || ptr != v.data() + v.size() || count < 0) {
           std::cerr << "Invalid --stages: " << v << " (expected a non-negative number)\n";
           return false;
         }
         f.stages = count;
         return true;
       }},
  };
}

std::optional<JobFilter> parse_query_args(int argc, char* argv[], int start,
                                          const char* usage) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = query_options();
  auto parsed = fetters::apps::parse_options(argc, argv, options, start);
  if (!parsed.valid || !parsed.positionals.empty()) {
    if (!parsed.positionals.empty()) {
      std::cerr << "Unexpected argument: " << parsed.positionals.front() << "\n";
    }
    std::cerr << "Usage: " << usage << "\n" << fetters::apps::format_options(options);
    return std::nullopt;
  }
  return parsed.config;
}
