
#ifndef __LIVEMIG_HOST_HPP__
#define __LIVEMIG_HOST_HPP__

#include <cstdint>
#include <string>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

namespace livemig {

  struct Aggregate
  {
    std::string name;
    double ram_allocation_ratio;

    Aggregate();
    Aggregate(const std::string & name, double ram_allocation_ratio);

    template <class Archive>
    void serialize(Archive & ar)
    {
      ar(CEREAL_NVP(name), CEREAL_NVP(ram_allocation_ratio));
    }
  };

  // Resource snapshot of a compute host.
  // Always fetched from the registry right before use, never kept around.
  struct HostFacts
  {
    std::string host;
    bool up;
    int64_t memory_mb;
    int64_t memory_mb_used;
    std::string hypervisor_type;
    // major * 1000000 + minor * 1000 + patch
    int64_t hypervisor_version;
    std::vector<Aggregate> aggregates;

    HostFacts();

    template <class Archive>
    void serialize(Archive & ar)
    {
      ar(
        CEREAL_NVP(host), CEREAL_NVP(up),
        CEREAL_NVP(memory_mb), CEREAL_NVP(memory_mb_used),
        CEREAL_NVP(hypervisor_type), CEREAL_NVP(hypervisor_version),
        CEREAL_NVP(aggregates)
      );
    }
  };

  int64_t hypervisor_version(int major, int minor, int patch);

}

#endif
