
#ifndef __LIVEMIG_DISPATCHER_HPP__
#define __LIVEMIG_DISPATCHER_HPP__

#include <string>

#include <livemig/collaborators.hpp>
#include <livemig/errors.hpp>
#include <livemig/instance.hpp>

namespace livemig {

  struct MigrationDispatcher
  {
    ComputeHost & _compute;

    MigrationDispatcher(ComputeHost & compute);

    // Returns once the source compute host acknowledged the migration.
    // Progress of the migration itself is not followed.
    check_result_t dispatch(const MigrationRequest & request, const InstanceSnapshot & instance,
        const std::string & source, const std::string & destination,
        const MigrateData & migrate_data);
  };

}

#endif
