#include <conduit/gateway/config.hpp>

#include <conduit/common/exceptions.hpp>
#include <conduit/common/util.hpp>

#include <cereal/archives/json.hpp>
#include <cereal/details/helpers.hpp>
#include <cereal/external/rapidjson/document.h>
#include <cereal/external/rapidjson/istreamwrapper.h>

#include <fmt/format.h>

namespace conduit::gateway::config {

  void AsyncExecutor::load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(enabled));
    common::util::cereal_load_value(archive, "threads", threads);

    if (threads <= 0) {
      throw common::InvalidConfigurationError{
          fmt::format("Async executor requires a positive number of threads, got {}", threads)
      };
    }
  }

  void AsyncExecutor::set_defaults()
  {
    enabled = true;
    threads = DEFAULT_THREADS_NUMBER;
  }

  void Gateway::load(cereal::JSONInputArchive& archive)
  {
    // All arguments are optional

    common::util::cereal_load_value(archive, "verbose", verbose);

    std::string channel;
    if (common::util::cereal_load_value(archive, "default-request-channel", channel)) {
      default_request_channel = channel;
    }
    if (common::util::cereal_load_value(archive, "error-channel", channel)) {
      error_channel = channel;
    }

    common::util::cereal_load_value(archive, "default-request-timeout", default_request_timeout);
    common::util::cereal_load_value(archive, "default-reply-timeout", default_reply_timeout);
    common::util::cereal_load_value(archive, "max-error-routing-depth", max_error_routing_depth);
    if (max_error_routing_depth < 0) {
      throw common::InvalidConfigurationError{"Error routing depth cannot be negative"};
    }

    common::util::cereal_load_optional(archive, "async-executor", async_executor);
  }

  void Gateway::set_defaults()
  {
    verbose = false;
    default_request_channel = std::nullopt;
    error_channel = std::nullopt;
    default_request_timeout = UNBOUNDED;
    default_reply_timeout = UNBOUNDED;
    max_error_routing_depth = DEFAULT_MAX_ERROR_ROUTING_DEPTH;
    async_executor.set_defaults();
  }

  Gateway Gateway::deserialize(std::istream& in_stream)
  {
    Gateway cfg;
    cereal::JSONInputArchive archive_in(in_stream);
    cfg.load(archive_in);
    return cfg;
  }

  namespace {

    std::optional<std::string>
    get_string(const std::string& method, const rapidjson::Value& obj, const char* key)
    {
      auto it = obj.FindMember(key);
      if (it == obj.MemberEnd()) {
        return std::nullopt;
      }
      if (!it->value.IsString()) {
        throw common::InvalidJSON{fmt::format("Field {} of method {} must be a string", key, method)};
      }
      return std::string{it->value.GetString()};
    }

    std::optional<long>
    get_timeout(const std::string& method, const rapidjson::Value& obj, const char* key)
    {
      auto it = obj.FindMember(key);
      if (it == obj.MemberEnd()) {
        return std::nullopt;
      }
      if (!it->value.IsInt64()) {
        throw common::InvalidJSON{fmt::format("Field {} of method {} must be an integer", key, method)};
      }
      return static_cast<long>(it->value.GetInt64());
    }

    std::optional<bool>
    get_bool(const std::string& method, const rapidjson::Value& obj, const char* key)
    {
      auto it = obj.FindMember(key);
      if (it == obj.MemberEnd()) {
        return std::nullopt;
      }
      if (!it->value.IsBool()) {
        throw common::InvalidJSON{fmt::format("Field {} of method {} must be a boolean", key, method)};
      }
      return it->value.GetBool();
    }

  } // namespace

  void Method::load(const std::string& name, const rapidjson::Value& obj)
  {
    if (!obj.IsObject()) {
      throw common::InvalidJSON{fmt::format("Configuration of method {} must be an object", name)};
    }

    request_channel = get_string(name, obj, "request-channel");
    error_channel = get_string(name, obj, "error-channel");
    request_timeout = get_timeout(name, obj, "request-timeout");
    reply_timeout = get_timeout(name, obj, "reply-timeout");
    expect_reply = get_bool(name, obj, "expect-reply");
    async_executor = get_bool(name, obj, "async-executor");

    // Literal payloads only; computed payloads are configured programmatically.
    auto payload_literal = get_string(name, obj, "payload");
    if (payload_literal.has_value()) {
      payload = [value = payload_literal.value()]() { return std::any{value}; };
    }

    auto it = obj.FindMember("headers");
    if (it != obj.MemberEnd()) {
      if (!it->value.IsObject()) {
        throw common::InvalidJSON{fmt::format("Headers of method {} must be an object", name)};
      }
      for (const auto& header : it->value.GetObject()) {
        if (!header.value.IsString()) {
          throw common::InvalidJSON{
              fmt::format("Header {} of method {} must be a string", header.name.GetString(), name)
          };
        }
        headers.insert_or_assign(header.name.GetString(), std::string{header.value.GetString()});
      }
    }

    it = obj.FindMember("argument-headers");
    if (it != obj.MemberEnd()) {
      if (!it->value.IsArray()) {
        throw common::InvalidJSON{fmt::format("Argument headers of method {} must be an array", name)};
      }
      for (const auto& header : it->value.GetArray()) {
        if (!header.IsString()) {
          throw common::InvalidJSON{
              fmt::format("Argument headers of method {} must be strings", name)
          };
        }
        argument_headers.emplace_back(header.GetString());
      }
    }
  }

  Method Method::merge(const Method& lower) const
  {
    Method result = *this;

    if (!result.request_channel) {
      result.request_channel = lower.request_channel;
    }
    if (!result.error_channel) {
      result.error_channel = lower.error_channel;
    }
    if (!result.request_timeout) {
      result.request_timeout = lower.request_timeout;
    }
    if (!result.reply_timeout) {
      result.reply_timeout = lower.reply_timeout;
    }
    if (!result.payload) {
      result.payload = lower.payload;
    }
    for (const auto& [name, value] : lower.headers) {
      result.headers.try_emplace(name, value);
    }
    if (result.argument_headers.empty()) {
      result.argument_headers = lower.argument_headers;
    }
    if (!result.expect_reply) {
      result.expect_reply = lower.expect_reply;
    }
    if (!result.async_executor) {
      result.async_executor = lower.async_executor;
    }

    return result;
  }

  void Methods::initialize(std::istream& in_stream)
  {
    rapidjson::Document doc;
    rapidjson::IStreamWrapper wrapper{in_stream};
    doc.ParseStream(wrapper);

    if (doc.HasParseError() || !doc.IsObject()) {
      throw common::InvalidJSON{"Could not parse method configuration"};
    }

    auto it = doc.FindMember("methods");
    if (it == doc.MemberEnd() || !it->value.IsObject()) {
      throw common::InvalidJSON{"Method configuration requires a 'methods' object"};
    }

    for (const auto& method_cfg : it->value.GetObject()) {

      std::string name = method_cfg.name.GetString();

      Method method;
      method.load(name, method_cfg.value);

      auto [_, inserted] = _methods.try_emplace(name, std::move(method));
      if (!inserted) {
        throw common::InvalidJSON{fmt::format("Method {} is configured twice", name)};
      }
    }
  }

  const Method* Methods::get(const std::string& name) const
  {
    auto it = _methods.find(name);
    if (it != _methods.end()) {
      return &it->second;
    }
    return nullptr;
  }

} // namespace conduit::gateway::config
