#ifndef CONDUIT_GATEWAY_GATEWAY_HPP
#define CONDUIT_GATEWAY_GATEWAY_HPP

#include <conduit/common/exceptions.hpp>
#include <conduit/gateway/config.hpp>
#include <conduit/gateway/correlator.hpp>
#include <conduit/gateway/engine.hpp>
#include <conduit/gateway/invoker.hpp>
#include <conduit/gateway/mapper.hpp>
#include <conduit/gateway/method.hpp>
#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/executor.hpp>

#include <any>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <spdlog/logger.h>

namespace conduit::gateway {

  // The declared return type cannot be completed with the configured executor.
  struct UnsupportedReturnTypeError : common::InvalidConfigurationError {

    UnsupportedReturnTypeError(const std::string& msg) : common::InvalidConfigurationError(msg) {}
  };

  /**
   * Dispatch table of resolved methods, built once by the GatewayFactory.
   */
  class Gateway {
  public:
    template <typename Sig>
    Invoker<Sig> invoker(const std::string& name) const
    {
      auto method = _find(name);
      if (method->metadata.signature != std::type_index{typeid(Sig)}) {
        throw common::InvalidConfigurationError{
            fmt::format("Method {} was registered with a different signature", name)
        };
      }
      return Invoker<Sig>{_engine, method};
    }

    // Type-erased call of a method completing on the calling thread. Returns the reply
    // payload; an empty value means no reply.
    std::any invoke(const std::string& name, std::vector<std::any> args) const;

    const ResolvedMethod& method(const std::string& name) const;

    bool contains(const std::string& name) const;

    size_t size() const
    {
      return _methods.size();
    }

    const messaging::ExecutorPtr& executor() const
    {
      return _executor;
    }

    const std::shared_ptr<Engine>& engine() const
    {
      return _engine;
    }

  private:
    friend class GatewayFactory;

    std::shared_ptr<const ResolvedMethod> _find(const std::string& name) const;

    std::shared_ptr<Engine> _engine;
    messaging::ExecutorPtr _executor;
    std::unordered_map<std::string, std::shared_ptr<const ResolvedMethod>> _methods;
  };

  /**
   * Collects method declarations and resolves their configuration.
   *
   * Precedence of settings, highest first: the method entry of the configuration
   * file, the programmatic registration, gateway defaults, built-in defaults.
   */
  class GatewayFactory {
  public:
    GatewayFactory(config::Gateway cfg, const messaging::ChannelResolver& channels);

    template <typename Sig>
    GatewayFactory& method(
        const std::string& name, config::Method cfg = {},
        std::vector<ExceptionDeclaration> exceptions = {}
    )
    {
      if (_registrations.find(name) != _registrations.end()) {
        throw common::ObjectExists{fmt::format("Method {} is already registered", name)};
      }
      _registrations.emplace(
          name, Registration{metadata_of<Sig>(name, std::move(exceptions)), std::move(cfg)}
      );
      return *this;
    }

    GatewayFactory& methods(config::Methods methods);

    // Replaces the executor created from the configuration.
    GatewayFactory& executor(messaging::ExecutorPtr executor);

    GatewayFactory& mapper(std::shared_ptr<ArgumentMapper> mapper);

    GatewayFactory& registry(std::shared_ptr<PendingRegistry> registry);

    // Throws InvalidConfigurationError on any configuration defect, and
    // UnsupportedReturnTypeError when a method cannot be completed.
    Gateway build() const;

    static CompletionStrategy
    select_strategy(const MethodMetadata& metadata, const messaging::ExecutorPtr& executor);

  private:
    struct Registration {
      MethodMetadata metadata;
      config::Method cfg;
    };

    std::shared_ptr<ResolvedMethod>
    _resolve(const Registration& registration, const messaging::ExecutorPtr& executor) const;

    messaging::ChannelPtr _channel(const std::string& method, const std::string& name) const;

    config::Gateway _cfg;
    const messaging::ChannelResolver& _channels;

    std::unordered_map<std::string, Registration> _registrations;
    config::Methods _file_methods;

    messaging::ExecutorPtr _executor;
    std::shared_ptr<ArgumentMapper> _mapper;
    std::shared_ptr<PendingRegistry> _registry;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace conduit::gateway

#endif
