
#ifndef __LIVEMIG_CONDUCTOR_CONDUCTOR_HPP__
#define __LIVEMIG_CONDUCTOR_CONDUCTOR_HPP__

#include <optional>
#include <string>

#include <livemig/live_migration.hpp>
#include <livemig/options.hpp>

#include "compute.hpp"
#include "db.hpp"
#include "registry.hpp"
#include "scheduler.hpp"

namespace livemig::conductor {

  // Runs migration tasks against the cluster database.
  struct Conductor
  {
    ClusterDB & _database;
    livemig::Options _options;

    LocalHostRegistry _registry;
    LocalImageService _images;
    LocalScheduler _scheduler;
    LocalCompute _compute;
    Collaborators _collaborators;

    Conductor(ClusterDB & database, const livemig::Options & options);

    // Empty when the instance is unknown.
    std::optional<Outcome> migrate(const MigrationRequest & request);

    LocalCompute & compute()
    {
      return _compute;
    }
  };

}

#endif
