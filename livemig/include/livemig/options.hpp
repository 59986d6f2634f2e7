
#ifndef __LIVEMIG_OPTIONS_HPP__
#define __LIVEMIG_OPTIONS_HPP__

namespace livemig {

  struct Options
  {
    static constexpr int UNLIMITED_RETRIES = -1;

    // Number of times to retry live migration before failing.
    // -1: try until out of hosts, 0: only try once, no retries.
    int migrate_max_retries;

    Options(int migrate_max_retries = UNLIMITED_RETRIES);

    bool unlimited_retries() const
    {
      return migrate_max_retries == UNLIMITED_RETRIES;
    }

    // Throws std::runtime_error for values below -1.
    void validate() const;
  };

}

#endif
