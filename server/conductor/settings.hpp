
#ifndef __LIVEMIG_CONDUCTOR_SETTINGS_HPP__
#define __LIVEMIG_CONDUCTOR_SETTINGS_HPP__

#include <cstdint>
#include <iostream>
#include <string>

#include <cereal/details/helpers.hpp>

#include <livemig/options.hpp>

namespace livemig::conductor {

  // Conductor configuration settings.
  // Includes the HTTP endpoint and the migration retry budget.
  struct Settings
  {
    std::string http_network_address;
    uint16_t http_network_port;
    int http_threads;

    int migrate_max_retries;

    template <class Archive>
    void load(Archive & ar )
    {
      ar(
        CEREAL_NVP(http_network_address), CEREAL_NVP(http_network_port),
        cereal::make_nvp("http-threads", http_threads),
        CEREAL_NVP(migrate_max_retries)
      );
    }

    livemig::Options options() const;

    static Settings deserialize(std::istream & in);
  };

}

#endif
