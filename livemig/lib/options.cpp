
#include <stdexcept>
#include <string>

#include <livemig/options.hpp>

namespace livemig {

  constexpr int Options::UNLIMITED_RETRIES;

  Options::Options(int migrate_max_retries):
    migrate_max_retries(migrate_max_retries)
  {}

  void Options::validate() const
  {
    if(migrate_max_retries < UNLIMITED_RETRIES)
      throw std::runtime_error(
        "Incorrect value of migrate_max_retries: " + std::to_string(migrate_max_retries)
      );
  }

}
