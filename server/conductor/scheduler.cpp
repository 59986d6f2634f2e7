
#include <algorithm>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "scheduler.hpp"

namespace livemig::conductor {

  LocalScheduler::LocalScheduler(ClusterDB & database):
    _database(database)
  {}

  double LocalScheduler::free_memory(const HostFacts & facts)
  {
    double ratio = facts.aggregates.size() == 1 ? facts.aggregates.front().ram_allocation_ratio : 1.0;
    return facts.memory_mb * ratio - facts.memory_mb_used;
  }

  std::optional<std::string> LocalScheduler::select_destination(
    const RequestSpec & spec, const FilterProperties & filter
  ) {
    const auto & ignored = filter.ignore_hosts;

    std::vector<HostRecord> candidates;
    for(auto & record : _database.hosts()) {

      if(std::find(ignored.begin(), ignored.end(), record.facts.host) != ignored.end()) {
        SPDLOG_DEBUG("[Scheduler] Host {} ignored", record.facts.host);
        continue;
      }

      if(!record.facts.up) {
        SPDLOG_DEBUG("[Scheduler] Host {} is down", record.facts.host);
        continue;
      }

      candidates.push_back(std::move(record));
    }

    if(candidates.empty()) {
      spdlog::info(
        "[Scheduler] No hosts left for instance {}, {} hosts ignored",
        spec.instance_properties.uuid, ignored.size()
      );
      return std::nullopt;
    }

    auto best = std::min_element(candidates.begin(), candidates.end(),
      [](const HostRecord & a, const HostRecord & b) {
        double free_a = free_memory(a.facts);
        double free_b = free_memory(b.facts);
        if(free_a != free_b)
          return free_a > free_b;
        return a.facts.host < b.facts.host;
      }
    );

    SPDLOG_DEBUG(
      "[Scheduler] Selected host {} for instance {} out of {} candidates",
      (*best).facts.host, spec.instance_properties.uuid, candidates.size()
    );
    return (*best).facts.host;
  }

}
