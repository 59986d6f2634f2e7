
#ifndef __LIVEMIG_INSTANCE_HPP__
#define __LIVEMIG_INSTANCE_HPP__

#include <cstdint>
#include <optional>
#include <string>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

namespace livemig {

  enum class PowerState
  {
    NOSTATE = 0,
    RUNNING = 1,
    PAUSED = 3,
    SHUTDOWN = 4,
    CRASHED = 6,
    SUSPENDED = 7
  };

  std::string power_state_serialize(PowerState state);
  // Throws std::runtime_error on an unknown name.
  PowerState power_state_deserialize(const std::string & name);

  struct Flavor
  {
    std::string name;
    int32_t vcpus;
    int32_t memory_mb;
    int32_t root_gb;
    int32_t ephemeral_gb;

    Flavor();
    Flavor(const std::string & name, int32_t vcpus, int32_t memory_mb, int32_t root_gb, int32_t ephemeral_gb);

    int32_t disk_gb() const
    {
      return root_gb + ephemeral_gb;
    }

    template <class Archive>
    void serialize(Archive & ar)
    {
      ar(
        CEREAL_NVP(name), CEREAL_NVP(vcpus), CEREAL_NVP(memory_mb),
        CEREAL_NVP(root_gb), CEREAL_NVP(ephemeral_gb)
      );
    }
  };

  // Read-only view of the workload being migrated.
  struct InstanceSnapshot
  {
    std::string uuid;
    std::string host;
    PowerState power_state;
    int32_t memory_mb;
    std::optional<std::string> image_ref;
    Flavor flavor;

    InstanceSnapshot();

    bool is_running() const
    {
      return power_state == PowerState::RUNNING;
    }

    template <class Archive>
    void save(Archive & ar) const
    {
      std::string state = power_state_serialize(power_state);
      std::string image = image_ref.value_or("");
      ar(
        CEREAL_NVP(uuid), CEREAL_NVP(host),
        cereal::make_nvp("power_state", state),
        CEREAL_NVP(memory_mb), cereal::make_nvp("image_ref", image),
        CEREAL_NVP(flavor)
      );
    }

    template <class Archive>
    void load(Archive & ar)
    {
      std::string state;
      std::string image;
      ar(
        CEREAL_NVP(uuid), CEREAL_NVP(host),
        cereal::make_nvp("power_state", state),
        CEREAL_NVP(memory_mb), cereal::make_nvp("image_ref", image),
        CEREAL_NVP(flavor)
      );
      power_state = power_state_deserialize(state);
      if(!image.empty())
        image_ref = image;
      else
        image_ref.reset();
    }
  };

  struct MigrationRequest
  {
    const std::string instance;
    // Empty when the scheduler has to choose the destination.
    const std::optional<std::string> destination;
    const bool block_migration;
    const bool disk_over_commit;

    MigrationRequest(const std::string & instance, std::optional<std::string> destination,
        bool block_migration, bool disk_over_commit);
  };

}

#endif
