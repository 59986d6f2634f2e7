
#include <sstream>
#include <stdexcept>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

#include "compute.hpp"

namespace livemig::conductor {

  constexpr int LocalCompute::POLLING_TIMEOUT_MS;

  MigrateData LiveMigrateData::encode() const
  {
    std::ostringstream out;
    {
      cereal::JSONOutputArchive archive_out(out);
      archive_out(cereal::make_nvp("migrate_data", *this));
    }
    return MigrateData{out.str()};
  }

  std::optional<LiveMigrateData> LiveMigrateData::decode(const MigrateData & data)
  {
    std::istringstream in{data.blob};
    LiveMigrateData result;
    try {
      cereal::JSONInputArchive archive_in(in);
      archive_in(cereal::make_nvp("migrate_data", result));
    } catch(const std::runtime_error & e) {
      spdlog::error("[Compute] Malformed migrate data: {}", e.what());
      return std::nullopt;
    }
    return result;
  }

  LocalCompute::LocalCompute(ClusterDB & database):
    _database(database),
    _shutdown(false)
  {}

  LocalCompute::~LocalCompute()
  {
    shutdown();
  }

  PrecheckResult LocalCompute::check_can_live_migrate_destination(
    const InstanceSnapshot & instance, const std::string & destination,
    bool block_migration, bool disk_over_commit
  ) {
    auto dest = _database.host(destination);
    if(!dest) {
      return PrecheckResult::reject(fmt::format("Destination host {} is unknown", destination));
    }
    if(!dest->facts.up) {
      return PrecheckResult::reject(fmt::format("Compute service of {} is down", destination));
    }

    auto source = _database.host(instance.host);
    if(!source) {
      return PrecheckResult::reject(fmt::format("Source host {} is unknown", instance.host));
    }

    bool shared_storage = !source->storage_pool.empty() && source->storage_pool == dest->storage_pool;

    if(block_migration) {

      if(shared_storage) {
        return PrecheckResult::reject(fmt::format(
          "Block migration can not be used with shared storage {}", dest->storage_pool
        ));
      }

      // With disk over-commit the destination accepts sparse images.
      int64_t required = instance.flavor.disk_gb();
      if(!disk_over_commit && dest->free_disk_gb < required) {
        return PrecheckResult::reject(fmt::format(
          "Unable to migrate {} to {}: Lack of disk(host:{} < instance:{})",
          instance.uuid, destination, dest->free_disk_gb, required
        ));
      }

    } else if(!shared_storage) {
      return PrecheckResult::reject(fmt::format(
        "{} is not on shared storage: Live migration can not be used without shared storage",
        destination
      ));
    }

    LiveMigrateData data{destination, block_migration, disk_over_commit, shared_storage};
    return PrecheckResult::accept(data.encode());
  }

  Acknowledgment LocalCompute::live_migration(
    const std::string & source, const InstanceSnapshot & instance,
    const std::string & destination, bool block_migration,
    const MigrateData & migrate_data
  ) {
    auto data = LiveMigrateData::decode(migrate_data);
    if(!data) {
      return Acknowledgment{false, "Malformed migrate data"};
    }
    if(data->destination != destination || data->block_migration != block_migration) {
      return Acknowledgment{false, fmt::format("Migrate data was issued for host {}", data->destination)};
    }

    int32_t migration_id = 0;
    auto code = _database.begin_migration(instance.uuid, source, destination, block_migration, migration_id);
    switch(code) {
      case ClusterDB::ResultCode::OK:
        break;
      case ClusterDB::ResultCode::INSTANCE_DOESNT_EXIST:
        return Acknowledgment{false, fmt::format("Instance {} could not be found", instance.uuid)};
      case ClusterDB::ResultCode::HOST_DOESNT_EXIST:
        return Acknowledgment{false, fmt::format("Destination host {} is unknown", destination)};
      default:
        return Acknowledgment{false, fmt::format("Instance {} is not on {} or is already migrating", instance.uuid, source)};
    }

    {
      std::lock_guard<std::mutex> lock{_producer_mutex};
      _queue.enqueue(migration_id);
    }
    spdlog::info("[Compute] Accepted migration {} of instance {} to {}", migration_id, instance.uuid, destination);
    return Acknowledgment{true, ""};
  }

  void LocalCompute::start()
  {
    if(_worker)
      return;
    _shutdown.store(false);
    _worker.reset(new std::thread(&LocalCompute::_process_migrations, this));
  }

  void LocalCompute::shutdown()
  {
    _shutdown.store(true);
    if(_worker && _worker->joinable()) {
      _worker->join();
    }
    _worker.reset();
  }

  int LocalCompute::process_pending()
  {
    if(_worker)
      throw std::logic_error("Pending migrations are applied by the running worker");
    return _drain();
  }

  int LocalCompute::_drain()
  {
    int count = 0;
    int32_t migration_id;
    while(_queue.try_dequeue(migration_id)) {
      _execute(migration_id);
      ++count;
    }
    return count;
  }

  void LocalCompute::_process_migrations()
  {
    spdlog::info("[Compute] Background thread starts processing migrations");
    while(!_shutdown.load()) {
      int32_t migration_id;
      if(_queue.wait_dequeue_timed(migration_id, POLLING_TIMEOUT_MS * 1000)) {
        _execute(migration_id);
      }
    }
    int remaining = _drain();
    spdlog::info("[Compute] Background thread stops processing migrations, {} finished on exit", remaining);
  }

  void LocalCompute::_execute(int32_t migration_id)
  {
    SPDLOG_DEBUG("[Compute] Executing migration {}", migration_id);
    auto code = _database.complete_migration(migration_id);
    if(code != ClusterDB::ResultCode::OK) {
      spdlog::error(
        "[Compute] Migration {} could not be completed, result code {}",
        migration_id, static_cast<int>(code)
      );
      if(_database.fail_migration(migration_id) != ClusterDB::ResultCode::OK) {
        spdlog::error("[Compute] Migration {} is not in progress", migration_id);
      }
    }
  }

}
