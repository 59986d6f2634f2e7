
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include <livemig/live_migration.hpp>

namespace livemig {

  const std::string & Outcome::value() const
  {
    if(failure)
      throw MigrationError{*failure};
    return destination;
  }

  const char* state_name(LiveMigrationTask::State state) noexcept
  {
    switch(state) {
      case LiveMigrationTask::State::START:
        return "start";
      case LiveMigrationTask::State::VALIDATING_SOURCE:
        return "validating-source";
      case LiveMigrationTask::State::SELECTING_DESTINATION:
        return "selecting-destination";
      case LiveMigrationTask::State::VALIDATING_EXPLICIT_DESTINATION:
        return "validating-explicit-destination";
      case LiveMigrationTask::State::DISPATCHING:
        return "dispatching";
      case LiveMigrationTask::State::DONE:
        return "done";
      case LiveMigrationTask::State::FAILED:
        return "failed";
    }
    return "unknown";
  }

  LiveMigrationTask::LiveMigrationTask(Collaborators & collaborators, const Options & options,
      const MigrationRequest & request, const InstanceSnapshot & instance):
    _request(request),
    _instance(instance),
    _source(instance.host),
    _validator(collaborators.hosts),
    _checker(collaborators.hosts, collaborators.compute),
    _selector(collaborators.scheduler, collaborators.images, _checker, options),
    _dispatcher(collaborators.compute),
    _attempted(instance.host),
    _state(State::START)
  {
    if(request.instance != instance.uuid)
      throw std::invalid_argument(
        "Migration request for instance " + request.instance + " used with snapshot of " + instance.uuid
      );
    options.validate();
  }

  LiveMigrationTask::State LiveMigrationTask::state() const
  {
    return _state;
  }

  const AttemptedHosts & LiveMigrationTask::attempted_hosts() const
  {
    return _attempted;
  }

  void LiveMigrationTask::_transition(State state)
  {
    SPDLOG_DEBUG("[LiveMigration] Instance {}: {} -> {}", _instance.uuid, state_name(_state), state_name(state));
    _state = state;
  }

  Outcome LiveMigrationTask::_fail(Failure && failure)
  {
    spdlog::warn("[LiveMigration] Migration of instance {} failed in state {}: {}",
      _instance.uuid, state_name(_state), failure.describe());
    _transition(State::FAILED);

    Outcome outcome;
    outcome.instance = _instance.uuid;
    outcome.source = _source;
    outcome.destination = _destination;
    outcome.failure = std::move(failure);
    return outcome;
  }

  Outcome LiveMigrationTask::execute()
  {
    if(_state != State::START)
      throw std::logic_error("Live migration task of instance " + _instance.uuid + " was already executed");

    try {
      return _execute();
    } catch(...) {
      _transition(State::FAILED);
      throw;
    }
  }

  Outcome LiveMigrationTask::_execute()
  {
    _transition(State::VALIDATING_SOURCE);

    if(auto failure = _validator.validate_running(_instance))
      return _fail(std::move(*failure));

    if(auto failure = _validator.validate_host_live(_instance, _source))
      return _fail(std::move(*failure));

    if(!_request.destination) {

      _transition(State::SELECTING_DESTINATION);
      auto failure = _selector.find_destination(_request, _instance, _attempted, _destination, _migrate_data);
      if(failure)
        return _fail(std::move(*failure));

    } else {

      // No substitution for a destination chosen by the caller.
      _transition(State::VALIDATING_EXPLICIT_DESTINATION);
      Verdict verdict = _checker.check(
        _instance, *_request.destination, _request.block_migration,
        _request.disk_over_commit, DestinationOrigin::REQUESTED
      );
      if(!verdict.compatible())
        return _fail(std::move(*verdict.failure));

      _destination = *_request.destination;
      _migrate_data = std::move(verdict.migrate_data);
    }

    _transition(State::DISPATCHING);
    if(auto failure = _dispatcher.dispatch(_request, _instance, _source, _destination, _migrate_data))
      return _fail(std::move(*failure));

    _transition(State::DONE);
    spdlog::info("[LiveMigration] Instance {} dispatched from {} to {}", _instance.uuid, _source, _destination);

    Outcome outcome;
    outcome.instance = _instance.uuid;
    outcome.source = _source;
    outcome.destination = _destination;
    outcome.migrate_data = _migrate_data;
    return outcome;
  }

  void LiveMigrationTask::rollback()
  {
    // Compensating actions belong to the compute layer, which has no
    // matching call for an accepted migration.
    throw std::logic_error("Rollback of live migration is not supported");
  }

}
