#pragma once

#include <cstdint>
#include <string>

namespace fetters::domain {

// Interned job title. Names are unique; rows are never deleted.
struct Title {
  std::int64_t id{0};
  std::string name;

  bool operator==(const Title&) const = default;
};

}  // namespace fetters::domain
