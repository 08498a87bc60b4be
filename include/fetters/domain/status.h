#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace fetters::domain {

// Application status labels seeded into the statuses table on first run.
inline constexpr std::array<std::string_view, 7> kDefaultStatuses = {
    "GHOSTED", "HIRED", "IN PROGRESS", "NOT HIRING ANYMORE", "OFFER RECEIVED", "PENDING", "REJECTED",
};

struct Status {
  std::int64_t id{0};
  std::string name;

  bool operator==(const Status&) const = default;
};

[[nodiscard]] bool is_default_status(std::string_view name);

}  // namespace fetters::domain
