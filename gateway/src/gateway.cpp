#include <conduit/gateway/gateway.hpp>

#include <conduit/common/util.hpp>

#include <spdlog/spdlog.h>

namespace conduit::gateway {

  std::shared_ptr<const ResolvedMethod> Gateway::_find(const std::string& name) const
  {
    auto it = _methods.find(name);
    if (it == _methods.end()) {
      throw common::ObjectDoesNotExist{fmt::format("Gateway has no method {}", name)};
    }
    return (*it).second;
  }

  const ResolvedMethod& Gateway::method(const std::string& name) const
  {
    return *_find(name);
  }

  bool Gateway::contains(const std::string& name) const
  {
    return _methods.find(name) != _methods.end();
  }

  std::any Gateway::invoke(const std::string& name, std::vector<std::any> args) const
  {
    auto method = _find(name);
    if (method->strategy != CompletionStrategy::BLOCKING &&
        method->strategy != CompletionStrategy::DEFERRED_COMPLETABLE) {
      throw common::InvalidConfigurationError{fmt::format(
          "Method {} completes with strategy {}, use a typed invoker", name,
          to_string(method->strategy)
      )};
    }

    Invocation invocation{method, std::move(args)};
    return _engine->invoke(invocation);
  }

  GatewayFactory::GatewayFactory(config::Gateway cfg, const messaging::ChannelResolver& channels)
      : _cfg(std::move(cfg)), _channels(channels)
  {
    _logger = common::util::create_logger("GatewayFactory");
  }

  GatewayFactory& GatewayFactory::methods(config::Methods methods)
  {
    _file_methods = std::move(methods);
    return *this;
  }

  GatewayFactory& GatewayFactory::executor(messaging::ExecutorPtr executor)
  {
    _executor = std::move(executor);
    return *this;
  }

  GatewayFactory& GatewayFactory::mapper(std::shared_ptr<ArgumentMapper> mapper)
  {
    _mapper = std::move(mapper);
    return *this;
  }

  GatewayFactory& GatewayFactory::registry(std::shared_ptr<PendingRegistry> registry)
  {
    _registry = std::move(registry);
    return *this;
  }

  CompletionStrategy GatewayFactory::select_strategy(
      const MethodMetadata& metadata, const messaging::ExecutorPtr& executor
  )
  {
    switch (metadata.return_kind) {
    case ReturnKind::VOID:
    case ReturnKind::VALUE:
    case ReturnKind::OPTIONAL:
      return CompletionStrategy::BLOCKING;
    case ReturnKind::FUTURE:
      if (!executor) {
        throw UnsupportedReturnTypeError{
            fmt::format("Method {} returns a future, but no executor is configured", metadata.name)
        };
      }
      return CompletionStrategy::EXECUTOR_FUTURE;
    case ReturnKind::LISTENABLE_FUTURE:
      if (!executor || !executor->supports_listenable()) {
        throw UnsupportedReturnTypeError{fmt::format(
            "Method {} returns a listenable future, but the executor does not support it",
            metadata.name
        )};
      }
      return CompletionStrategy::LISTENABLE_FUTURE;
    case ReturnKind::COMPLETABLE_FUTURE:
      return executor ? CompletionStrategy::EAGER_COMPLETABLE
                      : CompletionStrategy::DEFERRED_COMPLETABLE;
    case ReturnKind::COMPLETABLE_FUTURE_SUBTYPE:
      return CompletionStrategy::DEFERRED_COMPLETABLE;
    case ReturnKind::SINGLE:
      return CompletionStrategy::LAZY_SINGLE;
    }
    throw UnsupportedReturnTypeError{
        fmt::format("Method {} has an unknown return type", metadata.name)
    };
  }

  messaging::ChannelPtr
  GatewayFactory::_channel(const std::string& method, const std::string& name) const
  {
    try {
      return _channels.resolve(name);
    } catch (const common::ObjectDoesNotExist&) {
      std::throw_with_nested(common::InvalidConfigurationError{
          fmt::format("Method {} refers to unknown channel {}", method, name)
      });
    }
  }

  std::shared_ptr<ResolvedMethod> GatewayFactory::_resolve(
      const Registration& registration, const messaging::ExecutorPtr& executor
  ) const
  {
    const std::string& name = registration.metadata.name;

    config::Method cfg = registration.cfg;
    const config::Method* file_cfg = _file_methods.get(name);
    if (file_cfg) {
      cfg = file_cfg->merge(cfg);
    }

    auto method = std::make_shared<ResolvedMethod>(ResolvedMethod{registration.metadata});

    std::optional<std::string> request_channel =
        cfg.request_channel ? cfg.request_channel : _cfg.default_request_channel;
    if (!request_channel) {
      throw common::InvalidConfigurationError{
          fmt::format("Method {} has no request channel and no default is configured", name)
      };
    }
    method->request_channel = _channel(name, request_channel.value());

    std::optional<std::string> error_channel =
        cfg.error_channel ? cfg.error_channel : _cfg.error_channel;
    if (error_channel) {
      method->error_channel = _channel(name, error_channel.value());
      if (method->error_channel == method->request_channel) {
        throw common::InvalidConfigurationError{fmt::format(
            "Method {} uses channel {} both for requests and errors", name, error_channel.value()
        )};
      }
    }
    method->send_failure_channel = std::make_shared<SendFailureChannel>(name, method->error_channel);

    method->request_timeout =
        common::util::to_timeout(cfg.request_timeout.value_or(_cfg.default_request_timeout));
    method->reply_timeout =
        common::util::to_timeout(cfg.reply_timeout.value_or(_cfg.default_reply_timeout));

    method->payload = cfg.payload;
    method->headers = cfg.headers;
    method->argument_headers = cfg.argument_headers;
    method->max_error_routing_depth = _cfg.max_error_routing_depth;

    if (cfg.async_executor.value_or(true)) {
      method->executor = executor;
    }

    bool is_void = registration.metadata.return_kind == ReturnKind::VOID;
    if (registration.metadata.arity == 0 && !method->payload) {

      if (is_void) {
        throw common::InvalidConfigurationError{fmt::format(
            "Method {} has no arguments, no payload and no return value", name
        )};
      }
      if (!std::dynamic_pointer_cast<messaging::PollableChannel>(method->request_channel)) {
        throw common::InvalidConfigurationError{fmt::format(
            "Method {} receives from channel {}, which is not pollable", name,
            request_channel.value()
        )};
      }
      method->mode = InvocationMode::RECEIVE;

    } else if (is_void && !cfg.expect_reply.value_or(false)) {
      method->mode = InvocationMode::SEND;
    } else {
      method->mode = InvocationMode::SEND_AND_RECEIVE;
    }

    method->strategy = select_strategy(registration.metadata, method->executor);
    if (registration.metadata.return_kind == ReturnKind::COMPLETABLE_FUTURE_SUBTYPE) {
      _logger->warn(
          "Method {} returns a subtype of CompletableFuture; the executor cannot complete it, "
          "the reply payload must be the returned handle",
          name
      );
    }

    SPDLOG_LOGGER_DEBUG(
        _logger, "Resolved method {}: mode {}, strategy {}, channel {}", name,
        to_string(method->mode), to_string(method->strategy), request_channel.value()
    );
    return method;
  }

  Gateway GatewayFactory::build() const
  {
    for (const auto& [name, _] : _file_methods) {
      if (_registrations.find(name) == _registrations.end()) {
        throw common::InvalidConfigurationError{
            fmt::format("Configured method {} is not declared", name)
        };
      }
    }

    messaging::ExecutorPtr executor = _executor;
    if (!executor && _cfg.async_executor.enabled) {
      executor = std::make_shared<messaging::ThreadPoolExecutor>(_cfg.async_executor.threads);
    }

    Gateway gateway;
    gateway._executor = executor;

    for (const auto& [name, registration] : _registrations) {
      gateway._methods.emplace(name, _resolve(registration, executor));
    }

    auto mapper = _mapper ? _mapper : std::make_shared<DefaultArgumentMapper>();
    auto registry = _registry ? _registry : PendingRegistry::global();
    gateway._engine = std::make_shared<Engine>(mapper, registry);

    spdlog::info("Built gateway with {} methods", gateway._methods.size());
    return gateway;
  }

} // namespace conduit::gateway
