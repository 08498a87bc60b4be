#pragma once

#include "fetters/core/result.h"

#include <string>

namespace fetters::core {

// ErrorKind enumerates every failure the application surfaces to the user.
// Each kind renders to exactly one user-facing line (see to_string).
enum class ErrorKind {
  kApplicationDirUnavailable,
  kStoreResult,
  kIo,
  kPrompt,
  kMigration,
  kNoJobsAvailable,
  kSheetName,
  kSprintNameConflict,
  kStoreConnection,
  kConfigDeserialize,
  kConfigSerialize,
  kUnknown,
  kXlsx,
};

// Error is the single tagged error type returned by repositories, the config layer
// and the exporter. `message` holds the source message (or the sprint name for
// kNoJobsAvailable / kSprintNameConflict).
struct Error {
  ErrorKind kind{ErrorKind::kUnknown};
  std::string message;

  bool operator==(const Error&) const = default;
};

template <typename T>
using FettersResult = Result<T, Error>;

[[nodiscard]] inline Error make_error(ErrorKind kind, std::string message = {}) {
  return Error{kind, std::move(message)};
}

// Render the user-facing line for an error.
[[nodiscard]] std::string to_string(const Error& error);

}  // namespace fetters::core
