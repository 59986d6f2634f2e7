
#include <spdlog/fmt/fmt.h>

#include <livemig/errors.hpp>

namespace livemig {

  const char* error_kind_name(ErrorKind kind) noexcept
  {
    switch(kind) {
      case ErrorKind::INSTANCE_NOT_RUNNING:
        return "InstanceNotRunning";
      case ErrorKind::COMPUTE_SERVICE_UNAVAILABLE:
        return "ComputeServiceUnavailable";
      case ErrorKind::UNABLE_TO_MIGRATE_TO_SELF:
        return "UnableToMigrateToSelf";
      case ErrorKind::MIGRATION_PRECHECK_ERROR:
        return "MigrationPreCheckError";
      case ErrorKind::INVALID_HYPERVISOR_TYPE:
        return "InvalidHypervisorType";
      case ErrorKind::DESTINATION_HYPERVISOR_TOO_OLD:
        return "DestinationHypervisorTooOld";
      case ErrorKind::MIGRATION_PRECHECK_REJECTED:
        return "MigrationPreCheckRejected";
      case ErrorKind::NO_VALID_HOST:
        return "NoValidHost";
      case ErrorKind::DISPATCH_FAILED:
        return "DispatchFailed";
    }
    return "Unknown";
  }

  Failure::Failure(ErrorKind kind, bool retryable, const std::string & instance,
      const std::string & host, const std::string & reason):
    kind(kind),
    retryable(retryable),
    instance(instance),
    host(host),
    reason(reason)
  {}

  std::string Failure::describe() const
  {
    if(host.empty())
      return fmt::format("{} (instance {}): {}", error_kind_name(kind), instance, reason);
    return fmt::format("{} (instance {}, host {}): {}", error_kind_name(kind), instance, host, reason);
  }

  MigrationError::MigrationError(const Failure & failure):
    std::runtime_error(failure.describe()),
    failure(failure)
  {}

}
