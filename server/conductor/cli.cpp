#include <fstream>
#include <signal.h>

#include <spdlog/spdlog.h>

#include "manager.hpp"

livemig::conductor::Manager * instance = nullptr;

void signal_handler(int)
{
  if(instance)
    instance->shutdown();
}

int main(int argc, char ** argv)
{
  auto opts = livemig::conductor::opts(argc, argv);
  if(opts.verbose)
    spdlog::set_level(spdlog::level::debug);
  else
    spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");
  spdlog::info("Executing livemig conductor!");

  // Catch SIGINT
  struct sigaction sigIntHandler;
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, NULL);

  std::ifstream in_cfg{opts.json_config};
  if(!in_cfg.is_open()) {
    spdlog::error("Couldn't open the config file {}!", opts.json_config);
    return 1;
  }
  livemig::conductor::Settings settings = livemig::conductor::Settings::deserialize(in_cfg);
  if(opts.override_max_retries) {
    settings.migrate_max_retries = opts.migrate_max_retries;
    settings.options().validate();
  }
  spdlog::info("Live migration retries limited to {}", settings.migrate_max_retries);

  livemig::conductor::Manager mgr(settings);
  instance = &mgr;

  if(opts.initial_database != "") {
    mgr.read_database(opts.initial_database);
  }
  if(opts.output_database != "") {
    mgr.set_database_path(opts.output_database);
  }

  mgr.start();

  spdlog::info("Conductor is closing down");
  mgr.dump_database();
  instance = nullptr;

  return 0;
}
