
#include <stdexcept>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

#include "settings.hpp"

namespace livemig::conductor {

  livemig::Options Settings::options() const
  {
    return livemig::Options{migrate_max_retries};
  }

  Settings Settings::deserialize(std::istream & in)
  {
    Settings settings{};
    {
      cereal::JSONInputArchive archive_in(in);
      archive_in(cereal::make_nvp("config", settings));
    }

    if(settings.http_threads < 1) {
      spdlog::error("Incorrect number of HTTP threads {}!", settings.http_threads);
      throw std::runtime_error{"Incorrect number of HTTP threads!"};
    }
    settings.options().validate();

    return settings;
  }

}
