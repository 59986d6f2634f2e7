
#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include <livemig/selector.hpp>

namespace livemig {

  AttemptedHosts::AttemptedHosts(const std::string & source):
    _hosts{source}
  {}

  bool AttemptedHosts::add(const std::string & host)
  {
    if(contains(host))
      return false;
    _hosts.push_back(host);
    return true;
  }

  bool AttemptedHosts::contains(const std::string & host) const
  {
    return std::find(_hosts.begin(), _hosts.end(), host) != _hosts.end();
  }

  size_t AttemptedHosts::size() const
  {
    return _hosts.size();
  }

  int AttemptedHosts::retries() const
  {
    return static_cast<int>(_hosts.size()) - 1;
  }

  const std::vector<std::string> & AttemptedHosts::hosts() const
  {
    return _hosts;
  }

  DestinationSelector::DestinationSelector(Scheduler & scheduler, ImageService & images,
      CompatibilityChecker & checker, const Options & options):
    _scheduler(scheduler),
    _images(images),
    _checker(checker),
    _options(options)
  {}

  check_result_t DestinationSelector::check_not_over_max_retries(const InstanceSnapshot & instance,
      const AttemptedHosts & attempted) const
  {
    if(_options.unlimited_retries())
      return std::nullopt;

    if(attempted.retries() > _options.migrate_max_retries) {
      return Failure{
        ErrorKind::NO_VALID_HOST, false, instance.uuid, "",
        fmt::format(
          "Exceeded max scheduling retries {} for instance {} during live migration",
          _options.migrate_max_retries, instance.uuid
        )
      };
    }
    return std::nullopt;
  }

  RequestSpec DestinationSelector::request_spec(const InstanceSnapshot & instance) const
  {
    RequestSpec spec;
    spec.instance_properties = instance;
    spec.instance_type = instance.flavor;
    spec.instance_uuids.push_back(instance.uuid);

    if(instance.image_ref) {
      spec.image = _images.get_image_metadata(*instance.image_ref);
      if(!spec.image)
        spdlog::warn("[LiveMigration] No metadata for image {} of instance {}", *instance.image_ref, instance.uuid);
    }
    return spec;
  }

  check_result_t DestinationSelector::find_destination(const MigrationRequest & request,
      const InstanceSnapshot & instance, AttemptedHosts & attempted, std::string & host,
      MigrateData & migrate_data)
  {
    RequestSpec spec = request_spec(instance);

    while(true) {

      if(auto failure = check_not_over_max_retries(instance, attempted))
        return failure;

      FilterProperties filter;
      filter.ignore_hosts = attempted.hosts();
      auto candidate = _scheduler.select_destination(spec, filter);
      if(!candidate) {
        return Failure{
          ErrorKind::NO_VALID_HOST, false, instance.uuid, "",
          "No valid host was found. There are not enough hosts available."
        };
      }

      // Scheduler did not honor the exclusion list, asking again would not end.
      if(attempted.contains(*candidate)) {
        spdlog::error(
          "[LiveMigration] Scheduler returned already attempted host {} for instance {}",
          *candidate, instance.uuid
        );
        return Failure{
          ErrorKind::NO_VALID_HOST, false, instance.uuid, *candidate,
          fmt::format("Scheduler offered host {} which was already attempted", *candidate)
        };
      }

      Verdict verdict = _checker.check(
        instance, *candidate, request.block_migration, request.disk_over_commit,
        DestinationOrigin::SCHEDULED
      );

      if(verdict.compatible()) {
        host = *candidate;
        migrate_data = std::move(verdict.migrate_data);
        return std::nullopt;
      }

      if(!verdict.failure->retryable)
        return verdict.failure;

      spdlog::debug("[LiveMigration] Skipping host: {} because: {}", *candidate, verdict.failure->describe());
      attempted.add(*candidate);
    }
  }

}
