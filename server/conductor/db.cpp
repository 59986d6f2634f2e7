
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

#include "db.hpp"

namespace livemig::conductor {

  constexpr int HostRecord::NODE_NAME_LENGTH;

  HostRecord::HostRecord():
    free_disk_gb(0)
  {}

  ClusterDB::ClusterDB():
    _migration_count(0)
  {}

  ClusterDB::ResultCode ClusterDB::add_host(const HostRecord & record)
  {
    const std::string & node_name = record.facts.host;
    if(node_name.empty() || node_name.length() > HostRecord::NODE_NAME_LENGTH) {
      return ResultCode::MALFORMED_DATA;
    }
    if(record.facts.memory_mb < 0 || record.facts.memory_mb_used < 0 || record.free_disk_gb < 0) {
      return ResultCode::MALFORMED_DATA;
    }

    // Obtain write access
    writer_lock_t lock(_mutex);

    auto [it, success] = _hosts.emplace(node_name, record);
    if(!success) {
      return ResultCode::HOST_EXISTS;
    }

    spdlog::debug(
      "Adding new host {} with {} MB memory, hypervisor {} {}",
      node_name, record.facts.memory_mb, record.facts.hypervisor_type, record.facts.hypervisor_version
    );
    return ResultCode::OK;
  }

  ClusterDB::ResultCode ClusterDB::remove_host(const std::string & node_name)
  {
    // Obtain write access
    writer_lock_t lock(_mutex);
    bool erased = _hosts.erase(node_name);
    return erased ? ResultCode::OK : ResultCode::HOST_DOESNT_EXIST;
  }

  ClusterDB::ResultCode ClusterDB::update_host(const std::string & node_name, std::optional<bool> up,
      std::optional<int64_t> memory_mb_used)
  {
    if(memory_mb_used && *memory_mb_used < 0) {
      return ResultCode::MALFORMED_DATA;
    }

    writer_lock_t lock(_mutex);
    auto it = _hosts.find(node_name);
    if(it == _hosts.end()) {
      return ResultCode::HOST_DOESNT_EXIST;
    }

    HostFacts & facts = (*it).second.facts;
    if(up) {
      facts.up = *up;
    }
    if(memory_mb_used) {
      facts.memory_mb_used = *memory_mb_used;
    }
    SPDLOG_DEBUG("Host {} updated, up {}, used memory {} MB", node_name, facts.up, facts.memory_mb_used);
    return ResultCode::OK;
  }

  std::optional<HostRecord> ClusterDB::host(const std::string & node_name) const
  {
    reader_lock_t lock(_mutex);
    auto it = _hosts.find(node_name);
    if(it == _hosts.end()) {
      return std::nullopt;
    }
    return (*it).second;
  }

  std::vector<HostRecord> ClusterDB::hosts() const
  {
    reader_lock_t lock(_mutex);
    std::vector<HostRecord> result;
    result.reserve(_hosts.size());
    for(const auto & [name, record] : _hosts) {
      result.push_back(record);
    }
    return result;
  }

  ClusterDB::ResultCode ClusterDB::add_instance(const InstanceRecord & record)
  {
    if(record.instance.uuid.empty()) {
      return ResultCode::MALFORMED_DATA;
    }

    writer_lock_t lock(_mutex);
    auto [it, success] = _instances.emplace(record.instance.uuid, record);
    return success ? ResultCode::OK : ResultCode::INVALID_STATE;
  }

  std::optional<InstanceRecord> ClusterDB::instance(const std::string & uuid) const
  {
    reader_lock_t lock(_mutex);
    auto it = _instances.find(uuid);
    if(it == _instances.end()) {
      return std::nullopt;
    }
    return (*it).second;
  }

  std::optional<ImageMetadata> ClusterDB::image(const std::string & id) const
  {
    reader_lock_t lock(_mutex);
    auto it = _images.find(id);
    if(it == _images.end()) {
      return std::nullopt;
    }
    return (*it).second;
  }

  ClusterDB::ResultCode ClusterDB::begin_migration(const std::string & instance, const std::string & source,
      const std::string & destination, bool block_migration, int32_t & migration_id)
  {
    writer_lock_t lock(_mutex);

    auto it = _instances.find(instance);
    if(it == _instances.end()) {
      return ResultCode::INSTANCE_DOESNT_EXIST;
    }

    InstanceRecord & record = (*it).second;
    if(record.instance.host != source || !record.task_state.empty()) {
      SPDLOG_DEBUG(
        "Instance {} cannot start migration, host {}, task state '{}'",
        instance, record.instance.host, record.task_state
      );
      return ResultCode::INVALID_STATE;
    }
    if(_hosts.find(destination) == _hosts.end()) {
      return ResultCode::HOST_DOESNT_EXIST;
    }

    record.task_state = InstanceRecord::TASK_MIGRATING;
    migration_id = _migration_count++;
    _migrations.push_back(MigrationRecord{
      migration_id, instance, source, destination, block_migration, MigrationRecord::ACCEPTED
    });
    return ResultCode::OK;
  }

  MigrationRecord* ClusterDB::_migration(int32_t migration_id)
  {
    auto it = std::find_if(_migrations.begin(), _migrations.end(),
      [migration_id](const MigrationRecord & record) {
        return record.id == migration_id;
      }
    );
    return it != _migrations.end() ? &*it : nullptr;
  }

  ClusterDB::ResultCode ClusterDB::complete_migration(int32_t migration_id)
  {
    writer_lock_t lock(_mutex);

    MigrationRecord* migration = _migration(migration_id);
    if(!migration || migration->status != MigrationRecord::ACCEPTED) {
      return ResultCode::INVALID_STATE;
    }

    auto instance_it = _instances.find(migration->instance);
    if(instance_it == _instances.end()) {
      return ResultCode::INSTANCE_DOESNT_EXIST;
    }
    InstanceRecord & instance = (*instance_it).second;

    auto source_it = _hosts.find(migration->source);
    auto destination_it = _hosts.find(migration->destination);
    if(source_it == _hosts.end() || destination_it == _hosts.end()) {
      return ResultCode::HOST_DOESNT_EXIST;
    }
    HostRecord & source = (*source_it).second;
    HostRecord & destination = (*destination_it).second;

    int64_t memory = instance.instance.memory_mb;
    source.facts.memory_mb_used = std::max<int64_t>(0, source.facts.memory_mb_used - memory);
    destination.facts.memory_mb_used += memory;

    if(migration->block_migration) {
      int64_t disk = instance.instance.flavor.disk_gb();
      destination.free_disk_gb = std::max<int64_t>(0, destination.free_disk_gb - disk);
      source.free_disk_gb += disk;
    }

    instance.instance.host = migration->destination;
    instance.task_state.clear();
    migration->status = MigrationRecord::COMPLETED;

    spdlog::info(
      "Migration {} of instance {} from {} to {} completed",
      migration->id, migration->instance, migration->source, migration->destination
    );
    return ResultCode::OK;
  }

  ClusterDB::ResultCode ClusterDB::fail_migration(int32_t migration_id)
  {
    writer_lock_t lock(_mutex);

    MigrationRecord* migration = _migration(migration_id);
    if(!migration || migration->status != MigrationRecord::ACCEPTED) {
      return ResultCode::INVALID_STATE;
    }
    migration->status = MigrationRecord::ERROR;

    auto it = _instances.find(migration->instance);
    if(it != _instances.end()) {
      (*it).second.task_state.clear();
    }
    return ResultCode::OK;
  }

  std::vector<MigrationRecord> ClusterDB::migrations() const
  {
    reader_lock_t lock(_mutex);
    return _migrations;
  }

  void ClusterDB::read(const std::string & path)
  {
    std::ifstream in_db{path};
    if(!in_db.is_open()) {
      spdlog::error("Couldn't open the file {}!", path);
      throw std::runtime_error("Couldn't open the cluster database " + path);
    }
    read(in_db);
  }

  void ClusterDB::read(std::istream & in)
  {
    std::vector<HostRecord> hosts;
    std::vector<InstanceRecord> instances;
    std::vector<ImageRecord> images;
    std::vector<MigrationRecord> migrations;
    {
      cereal::JSONInputArchive archive_in(in);
      archive_in(
        cereal::make_nvp("hosts", hosts),
        cereal::make_nvp("instances", instances),
        cereal::make_nvp("images", images),
        cereal::make_nvp("migrations", migrations)
      );
    }

    writer_lock_t lock{_mutex};

    for(auto & record : hosts) {
      auto [it, success] = _hosts.emplace(record.facts.host, std::move(record));
      if(!success) {
        spdlog::debug("Ignoring duplicate host: {}", (*it).first);
      }
    }

    for(auto & record : instances) {
      auto [it, success] = _instances.emplace(record.instance.uuid, std::move(record));
      if(!success) {
        spdlog::debug("Ignoring duplicate instance: {}", (*it).first);
      }
    }

    for(auto & record : images) {
      _images.emplace(record.id, std::move(record.properties));
    }

    for(auto & record : migrations) {
      _migration_count = std::max(_migration_count, record.id + 1);
      _migrations.push_back(std::move(record));
    }

    spdlog::info(
      "Read cluster database with {} hosts, {} instances and {} images",
      _hosts.size(), _instances.size(), _images.size()
    );
  }

  void ClusterDB::write(const std::string & path) const
  {
    std::ofstream out{path};
    if(!out.is_open()) {
      spdlog::error("Couldn't open the file {}!", path);
      throw std::runtime_error("Couldn't write the cluster database " + path);
    }
    write(out);
  }

  void ClusterDB::write(std::ostream & out) const
  {
    reader_lock_t lock{_mutex};

    std::vector<HostRecord> hosts;
    for(const auto & [key, record] : _hosts) {
      hosts.push_back(record);
    }
    std::vector<InstanceRecord> instances;
    for(const auto & [key, record] : _instances) {
      instances.push_back(record);
    }
    std::vector<ImageRecord> images;
    for(const auto & [key, properties] : _images) {
      images.push_back(ImageRecord{key, properties});
    }

    cereal::JSONOutputArchive archive_out(out);
    archive_out(
      cereal::make_nvp("hosts", hosts),
      cereal::make_nvp("instances", instances),
      cereal::make_nvp("images", images),
      cereal::make_nvp("migrations", _migrations)
    );
  }

}
