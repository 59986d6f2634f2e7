
#ifndef __LIVEMIG_LIVE_MIGRATION_HPP__
#define __LIVEMIG_LIVE_MIGRATION_HPP__

#include <optional>
#include <string>

#include <livemig/collaborators.hpp>
#include <livemig/compatibility.hpp>
#include <livemig/dispatcher.hpp>
#include <livemig/errors.hpp>
#include <livemig/instance.hpp>
#include <livemig/options.hpp>
#include <livemig/selector.hpp>
#include <livemig/validator.hpp>

namespace livemig {

  struct Outcome
  {
    check_result_t failure;
    std::string instance;
    std::string source;
    std::string destination;
    MigrateData migrate_data;

    bool succeeded() const
    {
      return !failure.has_value();
    }

    // Destination of a dispatched migration, throws MigrationError otherwise.
    const std::string & value() const;
  };

  // Moves one running instance to another host.
  // A task serves a single request and is executed at most once.
  struct LiveMigrationTask
  {
    enum class State
    {
      START = 0,
      VALIDATING_SOURCE,
      SELECTING_DESTINATION,
      VALIDATING_EXPLICIT_DESTINATION,
      DISPATCHING,
      DONE,
      FAILED
    };

    LiveMigrationTask(Collaborators & collaborators, const Options & options,
        const MigrationRequest & request, const InstanceSnapshot & instance);
    LiveMigrationTask(const LiveMigrationTask &) = delete;
    LiveMigrationTask& operator=(const LiveMigrationTask &) = delete;

    Outcome execute();
    // Not supported, always throws std::logic_error.
    void rollback();

    State state() const;
    const AttemptedHosts & attempted_hosts() const;

  private:
    const MigrationRequest _request;
    const InstanceSnapshot _instance;
    const std::string _source;

    PreconditionValidator _validator;
    CompatibilityChecker _checker;
    DestinationSelector _selector;
    MigrationDispatcher _dispatcher;

    AttemptedHosts _attempted;
    State _state;
    std::string _destination;
    MigrateData _migrate_data;

    Outcome _execute();
    Outcome _fail(Failure && failure);
    void _transition(State state);
  };

  const char* state_name(LiveMigrationTask::State state) noexcept;

}

#endif
