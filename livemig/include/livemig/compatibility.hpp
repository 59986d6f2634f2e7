
#ifndef __LIVEMIG_COMPATIBILITY_HPP__
#define __LIVEMIG_COMPATIBILITY_HPP__

#include <string>

#include <livemig/collaborators.hpp>
#include <livemig/errors.hpp>
#include <livemig/host.hpp>
#include <livemig/instance.hpp>
#include <livemig/validator.hpp>

namespace livemig {

  // Where the destination came from decides whether its failures are retryable.
  enum class DestinationOrigin
  {
    REQUESTED = 0,
    SCHEDULED = 1
  };

  struct Verdict
  {
    check_result_t failure;
    MigrateData migrate_data;

    bool compatible() const
    {
      return !failure.has_value();
    }

    static Verdict pass(MigrateData && data);
    static Verdict fail(Failure && failure);
  };

  struct CompatibilityChecker
  {
    HostRegistry & _hosts;
    ComputeHost & _compute;
    PreconditionValidator _validator;

    CompatibilityChecker(HostRegistry & hosts, ComputeHost & compute);

    // Runs identity, liveness, capacity and hypervisor checks in that order,
    // then asks the destination for its precheck. Stops at the first failure.
    Verdict check(const InstanceSnapshot & instance, const std::string & destination,
        bool block_migration, bool disk_over_commit, DestinationOrigin origin);

    check_result_t check_destination_is_not_source(const InstanceSnapshot & instance,
        const std::string & destination) const;
    check_result_t check_destination_has_enough_memory(const InstanceSnapshot & instance,
        const std::string & destination, bool retryable) const;
    check_result_t check_compatible_with_source_hypervisor(const InstanceSnapshot & instance,
        const std::string & destination, bool retryable) const;

  private:
    check_result_t _resolve_aggregate(const InstanceSnapshot & instance, const HostFacts & facts,
        bool retryable, Aggregate & aggregate) const;
  };

}

#endif
