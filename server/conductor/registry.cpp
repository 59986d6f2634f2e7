
#include "registry.hpp"

namespace livemig::conductor {

  LocalHostRegistry::LocalHostRegistry(ClusterDB & database):
    _database(database)
  {}

  std::optional<HostFacts> LocalHostRegistry::get_host_facts(const std::string & host)
  {
    auto record = _database.host(host);
    if(!record) {
      return std::nullopt;
    }
    return record->facts;
  }

  LocalImageService::LocalImageService(ClusterDB & database):
    _database(database)
  {}

  std::optional<ImageMetadata> LocalImageService::get_image_metadata(const std::string & image_ref)
  {
    return _database.image(image_ref);
  }

}
