
#ifndef __LIVEMIG_CONDUCTOR_REGISTRY_HPP__
#define __LIVEMIG_CONDUCTOR_REGISTRY_HPP__

#include <optional>
#include <string>

#include <livemig/collaborators.hpp>

#include "db.hpp"

namespace livemig::conductor {

  // Every lookup copies the current record out of the database.
  struct LocalHostRegistry : public HostRegistry
  {
    ClusterDB & _database;

    LocalHostRegistry(ClusterDB & database);

    std::optional<HostFacts> get_host_facts(const std::string & host) override;
  };

  struct LocalImageService : public ImageService
  {
    ClusterDB & _database;

    LocalImageService(ClusterDB & database);

    std::optional<ImageMetadata> get_image_metadata(const std::string & image_ref) override;
  };

}

#endif
