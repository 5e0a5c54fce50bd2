#ifndef CONDUIT_COMMON_EXCEPTIONS_HPP
#define CONDUIT_COMMON_EXCEPTIONS_HPP

#include <stdexcept>

namespace conduit::common {

  struct ConduitException : std::runtime_error {

    ConduitException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : ConduitException {

    InvalidConfigurationError(const std::string& msg) : ConduitException(msg) {}
  };

  struct InvalidJSON : InvalidConfigurationError {

    InvalidJSON(const std::string& msg) : InvalidConfigurationError(msg) {}
  };

  struct ObjectExists : ConduitException {

    ObjectExists(const std::string& name) : ConduitException(name) {}
  };

  struct ObjectDoesNotExist : ConduitException {

    ObjectDoesNotExist(const std::string& name) : ConduitException(name) {}
  };

} // namespace conduit::common

#endif
