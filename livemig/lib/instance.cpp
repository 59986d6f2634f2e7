
#include <map>
#include <stdexcept>
#include <utility>

#include <livemig/instance.hpp>

namespace livemig {

  std::string power_state_serialize(PowerState state)
  {
    static std::map<PowerState, std::string> states = {
      {PowerState::NOSTATE, "nostate"},
      {PowerState::RUNNING, "running"},
      {PowerState::PAUSED, "paused"},
      {PowerState::SHUTDOWN, "shutdown"},
      {PowerState::CRASHED, "crashed"},
      {PowerState::SUSPENDED, "suspended"}
    };
    return states.at(state);
  }

  PowerState power_state_deserialize(const std::string & name)
  {
    static std::map<std::string, PowerState> states = {
      {"nostate", PowerState::NOSTATE},
      {"running", PowerState::RUNNING},
      {"paused", PowerState::PAUSED},
      {"shutdown", PowerState::SHUTDOWN},
      {"crashed", PowerState::CRASHED},
      {"suspended", PowerState::SUSPENDED}
    };
    auto it = states.find(name);
    if(it == states.end())
      throw std::runtime_error("Unrecognized power state: " + name);
    return (*it).second;
  }

  Flavor::Flavor():
    vcpus(0),
    memory_mb(0),
    root_gb(0),
    ephemeral_gb(0)
  {}

  Flavor::Flavor(const std::string & name, int32_t vcpus, int32_t memory_mb, int32_t root_gb, int32_t ephemeral_gb):
    name(name),
    vcpus(vcpus),
    memory_mb(memory_mb),
    root_gb(root_gb),
    ephemeral_gb(ephemeral_gb)
  {}

  InstanceSnapshot::InstanceSnapshot():
    power_state(PowerState::NOSTATE),
    memory_mb(0)
  {}

  MigrationRequest::MigrationRequest(const std::string & instance, std::optional<std::string> destination,
      bool block_migration, bool disk_over_commit):
    instance(instance),
    destination(std::move(destination)),
    block_migration(block_migration),
    disk_over_commit(disk_over_commit)
  {}

}
