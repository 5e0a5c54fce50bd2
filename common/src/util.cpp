#include <conduit/common/util.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace conduit::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name)
  {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(std::string{name}, sink);
    logger->set_pattern("[%H:%M:%S:%f] [%n] [P %P] [T %t] [%l] %v ");
    logger->set_level(spdlog::get_level());
    return logger;
  }

  std::optional<std::chrono::milliseconds> to_timeout(long value)
  {
    if (value < 0) {
      return std::nullopt;
    }
    return std::chrono::milliseconds{value};
  }

  std::vector<std::exception_ptr> cause_chain(std::exception_ptr ptr)
  {
    std::vector<std::exception_ptr> chain;
    while (ptr) {
      chain.push_back(ptr);
      try {
        std::rethrow_exception(ptr);
      } catch (const std::nested_exception& nested) {
        ptr = nested.nested_ptr();
      } catch (...) {
        // Innermost cause - it has already been recorded.
        ptr = nullptr;
      }
    }
    return chain;
  }

  std::string describe(const std::exception_ptr& ptr)
  {
    if (!ptr) {
      return "<none>";
    }
    try {
      std::rethrow_exception(ptr);
    } catch (const std::exception& exc) {
      return exc.what();
    } catch (...) {
      return "<non-standard exception>";
    }
  }

} // namespace conduit::common::util
