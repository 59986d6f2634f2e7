
#include <spdlog/spdlog.h>

#include "conductor.hpp"

namespace livemig::conductor {

  Conductor::Conductor(ClusterDB & database, const livemig::Options & options):
    _database(database),
    _options(options),
    _registry(database),
    _images(database),
    _scheduler(database),
    _compute(database),
    _collaborators{_registry, _scheduler, _images, _compute}
  {
    _options.validate();
  }

  std::optional<Outcome> Conductor::migrate(const MigrationRequest & request)
  {
    auto record = _database.instance(request.instance);
    if(!record) {
      spdlog::warn("[Conductor] Migration requested for unknown instance {}", request.instance);
      return std::nullopt;
    }

    spdlog::info(
      "[Conductor] Live migration of instance {} from {} to {}",
      request.instance, record->instance.host, request.destination.value_or("<scheduler>")
    );
    LiveMigrationTask task{_collaborators, _options, request, record->instance};
    return task.execute();
  }

}
