
#include <utility>

#include <spdlog/spdlog.h>

#include <livemig/compatibility.hpp>

namespace livemig {

  Verdict Verdict::pass(MigrateData && data)
  {
    Verdict verdict;
    verdict.migrate_data = std::move(data);
    return verdict;
  }

  Verdict Verdict::fail(Failure && failure)
  {
    Verdict verdict;
    verdict.failure = std::move(failure);
    return verdict;
  }

  CompatibilityChecker::CompatibilityChecker(HostRegistry & hosts, ComputeHost & compute):
    _hosts(hosts),
    _compute(compute),
    _validator(hosts)
  {}

  Verdict CompatibilityChecker::check(const InstanceSnapshot & instance, const std::string & destination,
      bool block_migration, bool disk_over_commit, DestinationOrigin origin)
  {
    bool retryable = origin == DestinationOrigin::SCHEDULED;

    if(auto failure = check_destination_is_not_source(instance, destination))
      return Verdict::fail(std::move(*failure));

    if(auto failure = _validator.validate_host_live(instance, destination, retryable))
      return Verdict::fail(std::move(*failure));

    if(auto failure = check_destination_has_enough_memory(instance, destination, retryable))
      return Verdict::fail(std::move(*failure));

    if(auto failure = check_compatible_with_source_hypervisor(instance, destination, retryable))
      return Verdict::fail(std::move(*failure));

    PrecheckResult result = _compute.check_can_live_migrate_destination(
      instance, destination, block_migration, disk_over_commit
    );
    if(!result.migrate_data) {
      return Verdict::fail(Failure{
        ErrorKind::MIGRATION_PRECHECK_REJECTED, retryable, instance.uuid, destination,
        result.reason
      });
    }

    return Verdict::pass(std::move(*result.migrate_data));
  }

  check_result_t CompatibilityChecker::check_destination_is_not_source(const InstanceSnapshot & instance,
      const std::string & destination) const
  {
    if(destination != instance.host)
      return std::nullopt;

    return Failure{
      ErrorKind::UNABLE_TO_MIGRATE_TO_SELF, false, instance.uuid, destination,
      fmt::format("Unable to migrate instance {} to current host {}", instance.uuid, destination)
    };
  }

  check_result_t CompatibilityChecker::_resolve_aggregate(const InstanceSnapshot & instance,
      const HostFacts & facts, bool retryable, Aggregate & aggregate) const
  {
    SPDLOG_DEBUG("Host {} belongs to {} aggregates", facts.host, facts.aggregates.size());

    if(facts.aggregates.size() == 1) {
      aggregate = facts.aggregates.front();
      return std::nullopt;
    }

    if(facts.aggregates.empty()) {
      return Failure{
        ErrorKind::MIGRATION_PRECHECK_ERROR, retryable, instance.uuid, facts.host,
        fmt::format("Unable to migrate {} to {}: Destination host is not in any aggregates",
          instance.uuid, facts.host)
      };
    }

    std::string names;
    for(const Aggregate & agg : facts.aggregates) {
      if(!names.empty())
        names += ", ";
      names += agg.name;
    }
    return Failure{
      ErrorKind::MIGRATION_PRECHECK_ERROR, retryable, instance.uuid, facts.host,
      fmt::format("Unable to migrate {} to {}: Destination host is in more than one aggregate: {}",
        instance.uuid, facts.host, names)
    };
  }

  check_result_t CompatibilityChecker::check_destination_has_enough_memory(const InstanceSnapshot & instance,
      const std::string & destination, bool retryable) const
  {
    auto facts = _hosts.get_host_facts(destination);
    if(!facts) {
      return Failure{
        ErrorKind::COMPUTE_SERVICE_UNAVAILABLE, retryable, instance.uuid, destination,
        "Compute service of the host is unknown"
      };
    }

    Aggregate aggregate;
    if(auto failure = _resolve_aggregate(instance, *facts, retryable, aggregate))
      return failure;

    double real_total = facts->memory_mb * aggregate.ram_allocation_ratio;
    double available = real_total - facts->memory_mb_used;
    SPDLOG_DEBUG(
      "Host {}: total memory {} MB, ratio {}, oversubscribed total {} MB, used {} MB, available {} MB",
      destination, facts->memory_mb, aggregate.ram_allocation_ratio, real_total,
      facts->memory_mb_used, available
    );

    // Equal is not enough, the instance needs strictly less than what is left.
    if(instance.memory_mb <= 0 || available <= instance.memory_mb) {
      return Failure{
        ErrorKind::MIGRATION_PRECHECK_ERROR, retryable, instance.uuid, destination,
        fmt::format("Unable to migrate {} to {}: Lack of memory(host:{} <= instance:{})",
          instance.uuid, destination, available, instance.memory_mb)
      };
    }

    return std::nullopt;
  }

  check_result_t CompatibilityChecker::check_compatible_with_source_hypervisor(const InstanceSnapshot & instance,
      const std::string & destination, bool retryable) const
  {
    auto source_info = _hosts.get_host_facts(instance.host);
    if(!source_info) {
      return Failure{
        ErrorKind::COMPUTE_SERVICE_UNAVAILABLE, false, instance.uuid, instance.host,
        "Compute service of the source host is unknown"
      };
    }

    auto destination_info = _hosts.get_host_facts(destination);
    if(!destination_info) {
      return Failure{
        ErrorKind::COMPUTE_SERVICE_UNAVAILABLE, retryable, instance.uuid, destination,
        "Compute service of the host is unknown"
      };
    }

    if(source_info->hypervisor_type != destination_info->hypervisor_type) {
      return Failure{
        ErrorKind::INVALID_HYPERVISOR_TYPE, retryable, instance.uuid, destination,
        fmt::format("Destination hypervisor type {} does not match source type {}",
          destination_info->hypervisor_type, source_info->hypervisor_type)
      };
    }

    if(source_info->hypervisor_version > destination_info->hypervisor_version) {
      return Failure{
        ErrorKind::DESTINATION_HYPERVISOR_TOO_OLD, retryable, instance.uuid, destination,
        fmt::format("Destination hypervisor version {} is older than source version {}",
          destination_info->hypervisor_version, source_info->hypervisor_version)
      };
    }

    return std::nullopt;
  }

}
