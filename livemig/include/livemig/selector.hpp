
#ifndef __LIVEMIG_SELECTOR_HPP__
#define __LIVEMIG_SELECTOR_HPP__

#include <cstddef>
#include <string>
#include <vector>

#include <livemig/collaborators.hpp>
#include <livemig/compatibility.hpp>
#include <livemig/errors.hpp>
#include <livemig/instance.hpp>
#include <livemig/options.hpp>

namespace livemig {

  // Hosts excluded from scheduling within one migration request.
  // Starts with the source host and only ever grows.
  struct AttemptedHosts
  {
    AttemptedHosts(const std::string & source);

    // Returns false when the host was already present.
    bool add(const std::string & host);
    bool contains(const std::string & host) const;

    size_t size() const;
    // The source host is not a retry.
    int retries() const;
    const std::vector<std::string> & hosts() const;

  private:
    std::vector<std::string> _hosts;
  };

  struct DestinationSelector
  {
    Scheduler & _scheduler;
    ImageService & _images;
    CompatibilityChecker & _checker;
    Options _options;

    DestinationSelector(Scheduler & scheduler, ImageService & images,
        CompatibilityChecker & checker, const Options & options);

    // On success, `host` and `migrate_data` describe the chosen destination.
    check_result_t find_destination(const MigrationRequest & request, const InstanceSnapshot & instance,
        AttemptedHosts & attempted, std::string & host, MigrateData & migrate_data);

    check_result_t check_not_over_max_retries(const InstanceSnapshot & instance,
        const AttemptedHosts & attempted) const;

    RequestSpec request_spec(const InstanceSnapshot & instance) const;
  };

}

#endif
