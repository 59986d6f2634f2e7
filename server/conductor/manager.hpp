
#ifndef __LIVEMIG_CONDUCTOR_MANAGER_HPP__
#define __LIVEMIG_CONDUCTOR_MANAGER_HPP__

#include <atomic>
#include <optional>
#include <string>

#include "conductor.hpp"
#include "db.hpp"
#include "http.hpp"
#include "settings.hpp"

namespace livemig::conductor {

  struct Options {
    std::string json_config;
    std::string initial_database;
    std::string output_database;
    int migrate_max_retries;
    bool override_max_retries;
    bool verbose;
  };
  Options opts(int, char**);

  struct Manager
  {
    std::optional<std::string> _database_output_path;

    ClusterDB _database;
    Settings _settings;
    Conductor _conductor;

    // Handling HTTP events
    HTTPServer _http_server;

    std::atomic<bool> _shutdown;
    static constexpr int POLLING_TIMEOUT_MS = 100;

    Manager(Settings &);

    void read_database(const std::string & name);
    void set_database_path(const std::string & name);
    void dump_database();
    void start();
    void shutdown();
  };

}

#endif
