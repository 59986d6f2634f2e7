
#ifndef __LIVEMIG_CONDUCTOR_COMPUTE_HPP__
#define __LIVEMIG_CONDUCTOR_COMPUTE_HPP__

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <readerwriterqueue.h>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

#include <livemig/collaborators.hpp>

#include "db.hpp"

namespace livemig::conductor {

  // Content of the MigrateData handed out by the precheck.
  struct LiveMigrateData
  {
    std::string destination;
    bool block_migration;
    bool disk_over_commit;
    bool is_shared_storage;

    template <class Archive>
    void serialize(Archive & ar)
    {
      ar(
        CEREAL_NVP(destination), CEREAL_NVP(block_migration),
        CEREAL_NVP(disk_over_commit), CEREAL_NVP(is_shared_storage)
      );
    }

    MigrateData encode() const;
    static std::optional<LiveMigrateData> decode(const MigrateData & data);
  };

  // Compute hosts backed by the cluster database.
  // Accepted migrations are applied by a background worker.
  struct LocalCompute : public ComputeHost
  {
    static constexpr int POLLING_TIMEOUT_MS = 100;

    typedef moodycamel::BlockingReaderWriterQueue<int32_t> migration_queue_t;

    ClusterDB & _database;
    migration_queue_t _queue;
    // The queue has a single producer slot.
    std::mutex _producer_mutex;
    std::atomic<bool> _shutdown;
    std::unique_ptr<std::thread> _worker;

    LocalCompute(ClusterDB & database);
    ~LocalCompute();

    PrecheckResult check_can_live_migrate_destination(
      const InstanceSnapshot & instance, const std::string & destination,
      bool block_migration, bool disk_over_commit
    ) override;

    Acknowledgment live_migration(
      const std::string & source, const InstanceSnapshot & instance,
      const std::string & destination, bool block_migration,
      const MigrateData & migrate_data
    ) override;

    void start();
    void shutdown();
    // Applies queued migrations on the calling thread.
    // Throws std::logic_error while the worker is running.
    int process_pending();

  private:
    int _drain();
    void _process_migrations();
    void _execute(int32_t migration_id);
  };

}

#endif
