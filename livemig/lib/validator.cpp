
#include <spdlog/spdlog.h>

#include <livemig/validator.hpp>

namespace livemig {

  PreconditionValidator::PreconditionValidator(HostRegistry & hosts):
    _hosts(hosts)
  {}

  check_result_t PreconditionValidator::validate_running(const InstanceSnapshot & instance) const
  {
    if(instance.is_running())
      return std::nullopt;

    return Failure{
      ErrorKind::INSTANCE_NOT_RUNNING, false, instance.uuid, instance.host,
      fmt::format("Instance is not running, power state {}", power_state_serialize(instance.power_state))
    };
  }

  check_result_t PreconditionValidator::validate_host_live(const InstanceSnapshot & instance,
      const std::string & host, bool retryable) const
  {
    auto facts = _hosts.get_host_facts(host);
    if(!facts) {
      SPDLOG_DEBUG("Host {} has no compute service record", host);
      return Failure{
        ErrorKind::COMPUTE_SERVICE_UNAVAILABLE, retryable, instance.uuid, host,
        "Compute service of the host is unknown"
      };
    }

    if(!facts->up) {
      SPDLOG_DEBUG("Host {} is down", host);
      return Failure{
        ErrorKind::COMPUTE_SERVICE_UNAVAILABLE, retryable, instance.uuid, host,
        "Compute service of the host is unavailable"
      };
    }

    return std::nullopt;
  }

}
