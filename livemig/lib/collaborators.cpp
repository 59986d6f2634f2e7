
#include <utility>

#include <livemig/collaborators.hpp>

namespace livemig {

  PrecheckResult PrecheckResult::accept(MigrateData && data)
  {
    PrecheckResult result;
    result.migrate_data = std::move(data);
    return result;
  }

  PrecheckResult PrecheckResult::reject(const std::string & reason)
  {
    PrecheckResult result;
    result.reason = reason;
    return result;
  }

}
