
#ifndef __LIVEMIG_VALIDATOR_HPP__
#define __LIVEMIG_VALIDATOR_HPP__

#include <string>

#include <livemig/collaborators.hpp>
#include <livemig/errors.hpp>
#include <livemig/instance.hpp>

namespace livemig {

  struct PreconditionValidator
  {
    HostRegistry & _hosts;

    PreconditionValidator(HostRegistry & hosts);

    check_result_t validate_running(const InstanceSnapshot & instance) const;
    // `retryable` is set on the failure for hosts proposed by the scheduler.
    check_result_t validate_host_live(const InstanceSnapshot & instance, const std::string & host,
        bool retryable = false) const;
  };

}

#endif
