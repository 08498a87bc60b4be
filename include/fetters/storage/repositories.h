#pragma once

#include "fetters/core/error.h"
#include "fetters/domain/insight.h"
#include "fetters/domain/job.h"
#include "fetters/domain/sprint.h"
#include "fetters/domain/stage.h"
#include "fetters/domain/status.h"
#include "fetters/domain/title.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fetters::storage {

// Repository interfaces isolate persistence from the command flows.
// Each repository owns write access to one table. Every mutating call either
// commits atomically or leaves the store unchanged and returns an error.

class IStatusRepository {
 public:
  virtual ~IStatusRepository() = default;

  // Insert each default status that is not present yet. Idempotent.
  [[nodiscard]] virtual core::FettersResult<bool> seed() = 0;
  [[nodiscard]] virtual core::FettersResult<std::vector<domain::Status>> list() const = 0;
  [[nodiscard]] virtual core::FettersResult<std::optional<domain::Status>> get_by_name(
      const std::string& name) const = 0;
};

class ITitleRepository {
 public:
  virtual ~ITitleRepository() = default;

  // Intern a title: insert, or return the existing row with the same name.
  [[nodiscard]] virtual core::FettersResult<domain::Title> get_or_create(
      const std::string& name) = 0;
  [[nodiscard]] virtual core::FettersResult<domain::Title> get(std::int64_t id) const = 0;
  [[nodiscard]] virtual core::FettersResult<std::vector<domain::Title>> list() const = 0;
};

class ISprintRepository {
 public:
  virtual ~ISprintRepository() = default;

  // Fails with kSprintNameConflict if the name is taken.
  [[nodiscard]] virtual core::FettersResult<domain::Sprint> add(
      const domain::NewSprint& sprint) = 0;
  // Returns the sprint with this name, creating it (start_date = today) if missing.
  [[nodiscard]] virtual core::FettersResult<domain::Sprint> get_or_create_by_name(
      const std::string& name) = 0;
  [[nodiscard]] virtual core::FettersResult<domain::Sprint> get(std::int64_t id) const = 0;
  [[nodiscard]] virtual core::FettersResult<std::optional<domain::Sprint>> get_by_name(
      const std::string& name) const = 0;
  [[nodiscard]] virtual core::FettersResult<domain::Sprint> update(
      std::int64_t id, const domain::SprintUpdate& changes) = 0;
  [[nodiscard]] virtual core::FettersResult<std::vector<domain::Sprint>> list_all() const = 0;
  // Inserts the sprint and, in the same transaction, closes previous_id by setting
  // its end_date to the new start_date when it has none. Nothing changes on failure.
  [[nodiscard]] virtual core::FettersResult<domain::Sprint> start_next(
      const domain::NewSprint& sprint, std::optional<std::int64_t> previous_id) = 0;

  // num_jobs += 1 / -= 1. Only the job repository calls these.
  [[nodiscard]] virtual core::FettersResult<bool> increment(std::int64_t id) = 0;
  [[nodiscard]] virtual core::FettersResult<bool> decrement(std::int64_t id) = 0;
};

class IJobRepository {
 public:
  virtual ~IJobRepository() = default;

  // Insert and bump the sprint counter in one transaction.
  [[nodiscard]] virtual core::FettersResult<domain::Job> add(const domain::NewJob& job) = 0;
  [[nodiscard]] virtual core::FettersResult<domain::Job> get(std::int64_t id) const = 0;
  // Write only engaged fields; a sprint move adjusts both sprint counters.
  [[nodiscard]] virtual core::FettersResult<domain::Job> update(
      std::int64_t id, const domain::JobUpdate& changes) = 0;
  // Delete the job and its stages, decrement the sprint counter. Returns the removed row.
  [[nodiscard]] virtual core::FettersResult<domain::Job> remove(std::int64_t id) = 0;

  [[nodiscard]] virtual core::FettersResult<std::vector<domain::ListedJob>> list(
      const domain::JobFilter& filter, const domain::Sprint& current_sprint) const = 0;

  [[nodiscard]] virtual core::FettersResult<std::vector<domain::CountAndPercentage>>
  count_per_status(const domain::Sprint& current_sprint) const = 0;
  [[nodiscard]] virtual core::FettersResult<std::vector<domain::CountAndPercentage>>
  count_per_sprint(const domain::Sprint& current_sprint) const = 0;
};

class IStageRepository {
 public:
  virtual ~IStageRepository() = default;

  // stage_number must come from next_stage_number(job_id).
  [[nodiscard]] virtual core::FettersResult<domain::InterviewStage> add(
      const domain::NewInterviewStage& stage) = 0;
  [[nodiscard]] virtual core::FettersResult<std::int64_t> next_stage_number(
      std::int64_t job_id) const = 0;
  [[nodiscard]] virtual core::FettersResult<domain::InterviewStage> get(std::int64_t id) const = 0;
  // Ordered by stage_number ascending.
  [[nodiscard]] virtual core::FettersResult<std::vector<domain::InterviewStage>> list(
      std::int64_t job_id) const = 0;
  [[nodiscard]] virtual core::FettersResult<domain::InterviewStage> update(
      std::int64_t id, const domain::InterviewStageUpdate& changes) = 0;
  // Delete a single row. Callers must renumber the job in the same transaction;
  // remove() does both.
  [[nodiscard]] virtual core::FettersResult<domain::InterviewStage> delete_stage(
      std::int64_t id) = 0;
  // Reassign 1..N in stage_number order, writing only rows whose number changed.
  [[nodiscard]] virtual core::FettersResult<bool> renumber(std::int64_t job_id) = 0;
  // delete_stage + renumber in one transaction.
  [[nodiscard]] virtual core::FettersResult<domain::InterviewStage> remove(std::int64_t id) = 0;
};

}  // namespace fetters::storage
