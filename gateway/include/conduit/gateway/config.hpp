#ifndef CONDUIT_GATEWAY_CONFIG_HPP
#define CONDUIT_GATEWAY_CONFIG_HPP

#include <conduit/messaging/message.hpp>

#include <any>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <cereal/external/rapidjson/fwd.h>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace conduit::gateway::config {

  struct AsyncExecutor {

    static constexpr int DEFAULT_THREADS_NUMBER = 4;

    AsyncExecutor()
    {
      set_defaults();
    }

    bool enabled;
    int threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  // Gateway-wide defaults. Timeouts are in milliseconds, negative is unbounded.
  struct Gateway {

    static constexpr long UNBOUNDED = -1;
    static constexpr int DEFAULT_MAX_ERROR_ROUTING_DEPTH = 1;

    Gateway()
    {
      set_defaults();
    }

    bool verbose;

    std::optional<std::string> default_request_channel;
    std::optional<std::string> error_channel;

    long default_request_timeout;
    long default_reply_timeout;

    int max_error_routing_depth;

    AsyncExecutor async_executor;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    static Gateway deserialize(std::istream& in_stream);
  };

  // Per-method settings; unset fields are inherited from the lower configuration level.
  struct Method {

    std::optional<std::string> request_channel;
    std::optional<std::string> error_channel;

    std::optional<long> request_timeout;
    std::optional<long> reply_timeout;

    // Payload of methods without arguments.
    std::function<std::any()> payload;

    messaging::Headers headers;

    // Header names of the arguments following the payload argument.
    std::vector<std::string> argument_headers;

    std::optional<bool> expect_reply;

    // False disables executor-backed completion for this method.
    std::optional<bool> async_executor;

    void load(const std::string& name, const rapidjson::Value& obj);

    // Fields set here win; unset fields and missing headers are taken from lower.
    Method merge(const Method& lower) const;
  };

  struct Methods {

    using container_t = std::unordered_map<std::string, Method>;
    using citer_t = typename container_t::const_iterator;

    void initialize(std::istream& in_stream);

    const Method* get(const std::string& name) const;

    size_t size() const
    {
      return _methods.size();
    }

    citer_t begin() const
    {
      return _methods.begin();
    }

    citer_t end() const
    {
      return _methods.end();
    }

  private:
    container_t _methods;
  };

} // namespace conduit::gateway::config

#endif
