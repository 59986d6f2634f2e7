
#ifndef __LIVEMIG_CONDUCTOR_DB_HPP__
#define __LIVEMIG_CONDUCTOR_DB_HPP__

#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include <livemig/collaborators.hpp>
#include <livemig/host.hpp>
#include <livemig/instance.hpp>

namespace livemig::conductor {

  struct HostRecord
  {
    static constexpr int NODE_NAME_LENGTH = 64;

    HostFacts facts;
    // Hosts with the same non-empty pool share instance storage.
    std::string storage_pool;
    int64_t free_disk_gb;

    HostRecord();

    template <class Archive>
    void serialize(Archive & ar)
    {
      facts.serialize(ar);
      ar(CEREAL_NVP(storage_pool), CEREAL_NVP(free_disk_gb));
    }
  };

  struct InstanceRecord
  {
    static constexpr const char* TASK_MIGRATING = "migrating";

    InstanceSnapshot instance;
    std::string task_state;

    template <class Archive>
    void save(Archive & ar) const
    {
      instance.save(ar);
      ar(CEREAL_NVP(task_state));
    }

    template <class Archive>
    void load(Archive & ar)
    {
      instance.load(ar);
      ar(CEREAL_NVP(task_state));
    }
  };

  struct ImageRecord
  {
    std::string id;
    ImageMetadata properties;

    template <class Archive>
    void serialize(Archive & ar)
    {
      ar(CEREAL_NVP(id), CEREAL_NVP(properties));
    }
  };

  struct MigrationRecord
  {
    static constexpr const char* ACCEPTED = "accepted";
    static constexpr const char* COMPLETED = "completed";
    static constexpr const char* ERROR = "error";

    int32_t id;
    std::string instance;
    std::string source;
    std::string destination;
    bool block_migration;
    std::string status;

    template <class Archive>
    void serialize(Archive & ar)
    {
      ar(
        CEREAL_NVP(id), CEREAL_NVP(instance), CEREAL_NVP(source),
        CEREAL_NVP(destination), CEREAL_NVP(block_migration), CEREAL_NVP(status)
      );
    }
  };

  // Hosts, instances and images known to the conductor, together with
  // the history of migrations it accepted.
  struct ClusterDB
  {
  private:

    typedef std::shared_lock<std::shared_mutex> reader_lock_t;
    typedef std::unique_lock<std::shared_mutex> writer_lock_t;

    std::unordered_map<std::string, HostRecord> _hosts;
    std::unordered_map<std::string, InstanceRecord> _instances;
    std::unordered_map<std::string, ImageMetadata> _images;
    std::vector<MigrationRecord> _migrations;
    int32_t _migration_count;

    // Reader-writer lock
    mutable std::shared_mutex _mutex;

  public:
    enum class ResultCode
    {
      OK = 0,
      HOST_EXISTS = 1,
      HOST_DOESNT_EXIST = 2,
      INSTANCE_DOESNT_EXIST = 3,
      MALFORMED_DATA = 4,
      INVALID_STATE = 5
    };

    ClusterDB();

    ResultCode add_host(const HostRecord & record);
    ResultCode remove_host(const std::string & node_name);
    ResultCode update_host(const std::string & node_name, std::optional<bool> up,
        std::optional<int64_t> memory_mb_used);
    std::optional<HostRecord> host(const std::string & node_name) const;
    std::vector<HostRecord> hosts() const;

    ResultCode add_instance(const InstanceRecord & record);
    std::optional<InstanceRecord> instance(const std::string & uuid) const;

    std::optional<ImageMetadata> image(const std::string & id) const;

    // Marks the instance as migrating, fails when it has moved or is
    // already migrating.
    ResultCode begin_migration(const std::string & instance, const std::string & source,
        const std::string & destination, bool block_migration, int32_t & migration_id);
    // Moves the instance and its resource usage to the destination.
    // A migration that cannot be applied stays accepted until failed.
    ResultCode complete_migration(int32_t migration_id);
    // Marks an accepted migration as failed and releases the instance.
    ResultCode fail_migration(int32_t migration_id);
    std::vector<MigrationRecord> migrations() const;

    void read(const std::string & path);
    void read(std::istream & in);
    void write(const std::string & path) const;
    void write(std::ostream & out) const;

  private:
    MigrationRecord* _migration(int32_t migration_id);
  };

}

#endif
