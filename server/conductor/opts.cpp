
#include <cstdlib>
#include <iostream>

#include <cxxopts.hpp>

#include "manager.hpp"

namespace livemig::conductor {

  Options opts(int argc, char ** argv)
  {
    cxxopts::Options options("livemig conductor",
      "Validate, place and dispatch live migrations of instances."
    );
    options.add_options()
      ("c,config", "JSON input config.",
       cxxopts::value<std::string>())
      ("i,input-database", "JSON with initial data of hosts and instances.",
       cxxopts::value<std::string>()->default_value(""))
      ("o,output-database", "Write and update JSON with data of hosts and instances.", cxxopts::value<std::string>()->default_value(""))
      ("migrate-max-retries", "Number of retries before failing, -1 tries until out of hosts.", cxxopts::value<int>())
      ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
      ("h,help", "Print usage", cxxopts::value<bool>()->default_value("false"))
    ;
    auto parsed_options = options.parse(argc, argv);
    if(parsed_options.count("help"))
    {
      std::cout << options.help() << std::endl;
      exit(0);
    }

    Options result;
    result.json_config = parsed_options["config"].as<std::string>();
    result.initial_database = parsed_options["input-database"].as<std::string>();
    result.output_database = parsed_options["output-database"].as<std::string>();
    result.override_max_retries = parsed_options.count("migrate-max-retries") > 0;
    result.migrate_max_retries = result.override_max_retries ? parsed_options["migrate-max-retries"].as<int>() : -1;
    result.verbose = parsed_options["verbose"].as<bool>();
    return result;
  }

}
