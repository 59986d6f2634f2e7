
#include <livemig/host.hpp>

namespace livemig {

  Aggregate::Aggregate():
    ram_allocation_ratio(1.0)
  {}

  Aggregate::Aggregate(const std::string & name, double ram_allocation_ratio):
    name(name),
    ram_allocation_ratio(ram_allocation_ratio)
  {}

  HostFacts::HostFacts():
    up(false),
    memory_mb(0),
    memory_mb_used(0),
    hypervisor_version(0)
  {}

  int64_t hypervisor_version(int major, int minor, int patch)
  {
    return static_cast<int64_t>(major) * 1000000 + minor * 1000 + patch;
  }

}
