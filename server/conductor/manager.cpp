
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "manager.hpp"

namespace livemig::conductor {

constexpr int Manager::POLLING_TIMEOUT_MS;

Manager::Manager(Settings &settings):
    _database_output_path(),
    _database(),
    _settings(settings),
    _conductor(_database, settings.options()),
    _http_server(_database, _conductor, settings),
    _shutdown(false)
  {}

void Manager::read_database(const std::string & name)
{
  _database.read(name);
}

void Manager::set_database_path(const std::string & name)
{
  _database_output_path = name;
}

void Manager::dump_database()
{
  if(_database_output_path.has_value()) {
    spdlog::info("Writing cluster database to {}", _database_output_path.value());
    _database.write(_database_output_path.value());
  }
}

void Manager::start() {
  _conductor.compute().start();
  // Start HTTP server on a new thread
  _http_server.start();
  spdlog::info("Begin listening and processing migration requests!");

  while (!_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(POLLING_TIMEOUT_MS));
  }

  _http_server.stop();
  _conductor.compute().shutdown();
}

void Manager::shutdown() {
  _shutdown.store(true);
}

}
