
#include <spdlog/spdlog.h>

#include <livemig/dispatcher.hpp>

namespace livemig {

  MigrationDispatcher::MigrationDispatcher(ComputeHost & compute):
    _compute(compute)
  {}

  check_result_t MigrationDispatcher::dispatch(const MigrationRequest & request, const InstanceSnapshot & instance,
      const std::string & source, const std::string & destination, const MigrateData & migrate_data)
  {
    spdlog::info(
      "[LiveMigration] Trigger migration of instance {} from {} to {}, block migration {}",
      instance.uuid, source, destination, request.block_migration
    );
    Acknowledgment ack = _compute.live_migration(
      source, instance, destination, request.block_migration, migrate_data
    );
    if(ack.accepted)
      return std::nullopt;

    return Failure{
      ErrorKind::DISPATCH_FAILED, false, instance.uuid, source,
      fmt::format("Migration to {} was not accepted: {}", destination, ack.reason)
    };
  }

}
