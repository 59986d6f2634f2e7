
#ifndef __LIVEMIG_COLLABORATORS_HPP__
#define __LIVEMIG_COLLABORATORS_HPP__

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <livemig/host.hpp>
#include <livemig/instance.hpp>

namespace livemig {

  // Handshake payload produced by the destination precheck.
  // The workflow passes it to the trigger call without looking inside.
  struct MigrateData
  {
    std::string blob;
  };

  typedef std::map<std::string, std::string> ImageMetadata;

  struct RequestSpec
  {
    InstanceSnapshot instance_properties;
    Flavor instance_type;
    std::vector<std::string> instance_uuids;
    std::optional<ImageMetadata> image;
  };

  struct FilterProperties
  {
    std::vector<std::string> ignore_hosts;
  };

  // Result of the destination-side precheck.
  // Either migrate_data is set, or reason explains the rejection.
  struct PrecheckResult
  {
    std::optional<MigrateData> migrate_data;
    std::string reason;

    static PrecheckResult accept(MigrateData && data);
    static PrecheckResult reject(const std::string & reason);
  };

  struct Acknowledgment
  {
    bool accepted;
    std::string reason;
  };

  // Collaborators are implemented elsewhere; an exception thrown by any of
  // them is a transport failure and propagates through the workflow.

  struct HostRegistry
  {
    virtual ~HostRegistry() = default;
    // Empty for an unknown host.
    virtual std::optional<HostFacts> get_host_facts(const std::string & host) = 0;
  };

  struct Scheduler
  {
    virtual ~Scheduler() = default;
    // Empty when no candidates remain.
    virtual std::optional<std::string> select_destination(
      const RequestSpec & spec, const FilterProperties & filter
    ) = 0;
  };

  struct ImageService
  {
    virtual ~ImageService() = default;
    virtual std::optional<ImageMetadata> get_image_metadata(const std::string & image_ref) = 0;
  };

  struct ComputeHost
  {
    virtual ~ComputeHost() = default;

    virtual PrecheckResult check_can_live_migrate_destination(
      const InstanceSnapshot & instance, const std::string & destination,
      bool block_migration, bool disk_over_commit
    ) = 0;

    virtual Acknowledgment live_migration(
      const std::string & source, const InstanceSnapshot & instance,
      const std::string & destination, bool block_migration,
      const MigrateData & migrate_data
    ) = 0;
  };

  struct Collaborators
  {
    HostRegistry & hosts;
    Scheduler & scheduler;
    ImageService & images;
    ComputeHost & compute;
  };

}

#endif
