#pragma once

#include "fetters/config/config_store.h"
#include "fetters/core/clock.h"
#include "fetters/storage/repositories.h"

namespace fetters::app {

// Services is the composition root handed to every command flow.
// It holds references (not ownership) to the repositories, the config store
// and the clock. The CLI creates the concrete instances and owns their lifetimes.
struct Services {
  storage::IStatusRepository& statuses;
  storage::ITitleRepository& titles;
  storage::ISprintRepository& sprints;
  storage::IJobRepository& jobs;
  storage::IStageRepository& stages;
  config::IConfigStore& config;
  core::IClock& clock;

  Services(storage::IStatusRepository& statuses, storage::ITitleRepository& titles,
           storage::ISprintRepository& sprints, storage::IJobRepository& jobs,
           storage::IStageRepository& stages, config::IConfigStore& config, core::IClock& clock)
      : statuses(statuses),
        titles(titles),
        sprints(sprints),
        jobs(jobs),
        stages(stages),
        config(config),
        clock(clock) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace fetters::app
