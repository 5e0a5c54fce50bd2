#ifndef CONDUIT_COMMON_UTIL_HPP
#define CONDUIT_COMMON_UTIL_HPP

#include <conduit/common/exceptions.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cereal/archives/json.hpp>
#include <spdlog/spdlog.h>

namespace conduit::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  // Negative values mean "no value" in configuration files.
  std::optional<std::chrono::milliseconds> to_timeout(long value);

  // Outermost first. Walks std::nested_exception links.
  std::vector<std::exception_ptr> cause_chain(std::exception_ptr ptr);

  std::string describe(const std::exception_ptr& ptr);

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {

    // Unfortunately, Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      // Catch non existing object
      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {

        archive.setNextName(nullptr);
        obj.set_defaults();

      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    }
  }

  template <typename T>
  bool cereal_load_value(cereal::JSONInputArchive& archive, const std::string& name, T& value)
  {
    try {
      archive(cereal::make_nvp(name, value));
      return true;
    } catch (cereal::Exception& exc) {

      if (std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
          std::string::npos) {
        archive.setNextName(nullptr);
        return false;
      }

      throw common::InvalidConfigurationError(
          fmt::format("Could not parse value of {}, reason: {}", name, exc.what())
      );
    }
  }

} // namespace conduit::common::util

#endif
