#include "fetters/core/error.h"

namespace fetters::core {

std::string to_string(const Error& error) {
  switch (error.kind) {
    case ErrorKind::kApplicationDirUnavailable:
      return "Could not retrieve system application directories!";
    case ErrorKind::kStoreResult:
      return "SQLite query error: " + error.message;
    case ErrorKind::kIo:
      return "IO Error: " + error.message;
    case ErrorKind::kPrompt:
      return "Prompt error: " + error.message;
    case ErrorKind::kMigration:
      if (error.message.empty()) {
        return "Failed to run migrations!";
      }
      return "Failed to run migrations! (" + error.message + ")";
    case ErrorKind::kNoJobsAvailable:
      return "No job applications tracked for the current sprint [" + error.message + "]";
    case ErrorKind::kSheetName:
      return "Set sheet name error: " + error.message;
    case ErrorKind::kSprintNameConflict:
      return "There is already a sprint with name " + error.message + ". Try renaming the sprint.";
    case ErrorKind::kStoreConnection:
      return "Failed to connect to SQLite database: " + error.message;
    case ErrorKind::kConfigDeserialize:
      return "TOML deserialization error: " + error.message;
    case ErrorKind::kConfigSerialize:
      return "TOML serialization error: " + error.message;
    case ErrorKind::kUnknown:
      return error.message;
    case ErrorKind::kXlsx:
      return "XLSX write error: " + error.message;
  }
  return error.message;
}

}  // namespace fetters::core
