#include "fetters/domain/status.h"

#include <algorithm>

namespace fetters::domain {

bool is_default_status(std::string_view name) {
  return std::find(kDefaultStatuses.begin(), kDefaultStatuses.end(), name) !=
         kDefaultStatuses.end();
}

}  // namespace fetters::domain
