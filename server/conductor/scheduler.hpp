
#ifndef __LIVEMIG_CONDUCTOR_SCHEDULER_HPP__
#define __LIVEMIG_CONDUCTOR_SCHEDULER_HPP__

#include <optional>
#include <string>

#include <livemig/collaborators.hpp>

#include "db.hpp"

namespace livemig::conductor {

  // Minimal placement: live hosts outside of the ignore list, ranked by
  // free oversubscribed memory. Feasibility is left to the migration task.
  struct LocalScheduler : public Scheduler
  {
    ClusterDB & _database;

    LocalScheduler(ClusterDB & database);

    std::optional<std::string> select_destination(
      const RequestSpec & spec, const FilterProperties & filter
    ) override;

    static double free_memory(const HostFacts & facts);
  };

}

#endif
