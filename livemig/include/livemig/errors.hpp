
#ifndef __LIVEMIG_ERRORS_HPP__
#define __LIVEMIG_ERRORS_HPP__

#include <optional>
#include <stdexcept>
#include <string>

namespace livemig {

  enum class ErrorKind
  {
    INSTANCE_NOT_RUNNING = 0,
    COMPUTE_SERVICE_UNAVAILABLE = 1,
    UNABLE_TO_MIGRATE_TO_SELF = 2,
    MIGRATION_PRECHECK_ERROR = 3,
    INVALID_HYPERVISOR_TYPE = 4,
    DESTINATION_HYPERVISOR_TOO_OLD = 5,
    MIGRATION_PRECHECK_REJECTED = 6,
    NO_VALID_HOST = 7,
    DISPATCH_FAILED = 8
  };

  const char* error_kind_name(ErrorKind kind) noexcept;

  // Terminal or retryable failure of a workflow step.
  // The selector only looks at `retryable` to decide whether a candidate
  // can be skipped.
  struct Failure
  {
    ErrorKind kind;
    bool retryable;
    std::string instance;
    std::string host;
    std::string reason;

    Failure(ErrorKind kind, bool retryable, const std::string & instance,
        const std::string & host, const std::string & reason);

    std::string describe() const;
  };

  typedef std::optional<Failure> check_result_t;

  struct MigrationError : std::runtime_error
  {
    Failure failure;

    MigrationError(const Failure & failure);

    ErrorKind kind() const
    {
      return failure.kind;
    }
  };

}

#endif
