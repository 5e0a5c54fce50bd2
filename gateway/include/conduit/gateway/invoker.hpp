#ifndef CONDUIT_GATEWAY_INVOKER_HPP
#define CONDUIT_GATEWAY_INVOKER_HPP

#include <conduit/gateway/engine.hpp>
#include <conduit/gateway/future.hpp>
#include <conduit/gateway/method.hpp>
#include <conduit/gateway/single.hpp>
#include <conduit/messaging/exceptions.hpp>

#include <any>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include <fmt/format.h>

namespace conduit::gateway {

  namespace detail {

    template <typename T>
    T payload_cast(const ResolvedMethod& method, std::any& payload)
    {
      try {
        return std::any_cast<T>(std::move(payload));
      } catch (const std::bad_any_cast&) {
        std::throw_with_nested(messaging::MessagingException{fmt::format(
            "Reply of {} carries a payload of type {}, expected {}", method.name(),
            payload.type().name(), typeid(T).name()
        )});
      }
    }

    // Converts the reply payload to the declared result type.
    template <typename R>
    R from_payload(const ResolvedMethod& method, std::any&& payload)
    {
      if constexpr (std::is_void_v<R>) {
        return;
      } else if constexpr (is_specialization<R, std::optional>::value) {
        if (!payload.has_value()) {
          return std::nullopt;
        }
        if (payload.type() == typeid(R)) {
          return std::any_cast<R>(std::move(payload));
        }
        return R{payload_cast<typename R::value_type>(method, payload)};
      } else {
        // The declared type cannot express a missing reply.
        if (!payload.has_value()) {
          throw messaging::ReplyTimeoutException{
              fmt::format("No reply received for {}", method.name())
          };
        }
        return payload_cast<R>(method, payload);
      }
    }

    template <typename... Args>
    std::vector<std::any> pack(Args&&... args)
    {
      std::vector<std::any> arguments;
      arguments.reserve(sizeof...(Args));
      (arguments.emplace_back(std::forward<Args>(args)), ...);
      return arguments;
    }

  } // namespace detail

  template <typename Sig>
  class Invoker;

  /**
   * Typed entry point of one gateway method.
   *
   * The completion strategy is fixed when the gateway is built; the call operator
   * only follows it. Invokers are cheap to copy and share the engine of the gateway.
   */
  template <typename R, typename... Args>
  class Invoker<R(Args...)> {
  public:
    Invoker(std::shared_ptr<Engine> engine, std::shared_ptr<const ResolvedMethod> method)
        : _engine(std::move(engine)), _method(std::move(method))
    {
    }

    R operator()(Args... args) const
    {
      constexpr ReturnKind kind = return_kind_of<R>();
      auto arguments = detail::pack(std::forward<Args>(args)...);

      if constexpr (kind == ReturnKind::VOID || kind == ReturnKind::VALUE ||
                    kind == ReturnKind::OPTIONAL) {

        return detail::from_payload<R>(*_method, _run(_engine, _method, std::move(arguments)));

      } else if constexpr (kind == ReturnKind::FUTURE) {

        using T = decltype(std::declval<R>().get());
        return submit<T>(*_method->executor, _task<T>(std::move(arguments)));

      } else if constexpr (kind == ReturnKind::LISTENABLE_FUTURE) {

        using T = typename R::value_type;
        return submit_listenable<T>(*_method->executor, _task<T>(std::move(arguments)));

      } else if constexpr (kind == ReturnKind::COMPLETABLE_FUTURE ||
                           kind == ReturnKind::COMPLETABLE_FUTURE_SUBTYPE) {

        if constexpr (kind == ReturnKind::COMPLETABLE_FUTURE) {
          if (_method->strategy == CompletionStrategy::EAGER_COMPLETABLE) {
            using T = typename R::value_type;
            return supply_async<T>(*_method->executor, _task<T>(std::move(arguments)));
          }
        }

        // The downstream flow returns the handle itself.
        auto payload = _run(_engine, _method, std::move(arguments));
        if (!payload.has_value()) {
          return R{};
        }
        return detail::payload_cast<R>(*_method, payload);

      } else {

        using T = typename R::value_type;
        using value_t = typename R::value_t;
        return R::from_callable([engine = _engine, method = _method,
                                 arguments = std::move(arguments)]() -> std::optional<value_t> {
          // Every subscription is a separate invocation.
          auto payload = _run(engine, method, arguments);
          if (!payload.has_value()) {
            return std::nullopt;
          }
          if constexpr (std::is_void_v<T>) {
            return value_t{};
          } else {
            return detail::payload_cast<T>(*method, payload);
          }
        });
      }
    }

    const ResolvedMethod& method() const
    {
      return *_method;
    }

  private:
    static std::any _run(
        const std::shared_ptr<Engine>& engine, const std::shared_ptr<const ResolvedMethod>& method,
        std::vector<std::any> arguments
    )
    {
      Invocation invocation{method, std::move(arguments)};
      return engine->invoke(invocation);
    }

    template <typename T>
    std::function<T()> _task(std::vector<std::any> arguments) const
    {
      return [engine = _engine, method = _method, arguments = std::move(arguments)]() -> T {
        return detail::from_payload<T>(*method, _run(engine, method, arguments));
      };
    }

    std::shared_ptr<Engine> _engine;
    std::shared_ptr<const ResolvedMethod> _method;
  };

} // namespace conduit::gateway

#endif
