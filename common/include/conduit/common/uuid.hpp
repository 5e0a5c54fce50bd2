#ifndef CONDUIT_COMMON_UUID_HPP
#define CONDUIT_COMMON_UUID_HPP

#include <random>
#include <string>

#include <uuid.h>

namespace conduit::common {

  class UUID {
  public:
    UUID() : _generator{_rd()}, _uuid_generator{_generator} {}

    std::string generate_str()
    {
      return uuids::to_string(_uuid_generator());
    }

    // Generator is not thread-safe; one instance per thread.
    static std::string next()
    {
      thread_local UUID generator;
      return generator.generate_str();
    }

  private:
    std::random_device _rd;
    std::mt19937 _generator;
    uuids::uuid_random_generator _uuid_generator;
  };

} // namespace conduit::common

#endif
