#ifndef CONDUIT_GATEWAY_METHOD_HPP
#define CONDUIT_GATEWAY_METHOD_HPP

#include <conduit/gateway/future.hpp>
#include <conduit/gateway/single.hpp>
#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/executor.hpp>
#include <conduit/messaging/message.hpp>

#include <any>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace conduit::gateway {

  enum class ReturnKind {
    VOID,
    VALUE,
    OPTIONAL,
    FUTURE,
    LISTENABLE_FUTURE,
    COMPLETABLE_FUTURE,
    COMPLETABLE_FUTURE_SUBTYPE,
    SINGLE
  };

  enum class CompletionStrategy {
    BLOCKING,
    EXECUTOR_FUTURE,
    LISTENABLE_FUTURE,
    EAGER_COMPLETABLE,
    DEFERRED_COMPLETABLE,
    LAZY_SINGLE
  };

  enum class InvocationMode {
    // Request with a private reply destination.
    SEND_AND_RECEIVE,
    // Fire-and-forget.
    SEND,
    // Pull from the request channel without sending.
    RECEIVE
  };

  std::string_view to_string(ReturnKind kind);

  std::string_view to_string(CompletionStrategy strategy);

  std::string_view to_string(InvocationMode mode);

  struct ExceptionDeclaration {
    std::string name;
    std::function<bool(const std::exception_ptr&)> matches;
  };

  template <typename E>
  ExceptionDeclaration declare()
  {
    return ExceptionDeclaration{
        typeid(E).name(),
        [](const std::exception_ptr& ptr) {
          try {
            std::rethrow_exception(ptr);
          } catch (const E&) {
            return true;
          } catch (...) {
            return false;
          }
        }
    };
  }

  template <typename... E>
  std::vector<ExceptionDeclaration> throws()
  {
    return std::vector<ExceptionDeclaration>{declare<E>()...};
  }

  // Method identity.
  struct MethodMetadata {
    std::string name;
    ReturnKind return_kind;
    std::type_index signature;
    size_t arity;
    std::vector<ExceptionDeclaration> exceptions;
  };

  // Configuration of one method after merging all configuration levels.
  struct ResolvedMethod {
    MethodMetadata metadata;

    InvocationMode mode;
    CompletionStrategy strategy;

    messaging::ChannelPtr request_channel;
    // Absent when no error channel is configured.
    messaging::ChannelPtr error_channel;
    // Receives failures of fire-and-forget sends: forwards to error_channel or logs.
    messaging::ChannelPtr send_failure_channel;

    messaging::timeout_t request_timeout;
    messaging::timeout_t reply_timeout;

    std::function<std::any()> payload;
    messaging::Headers headers;
    std::vector<std::string> argument_headers;

    // Null when executor-backed completion is disabled for this method.
    messaging::ExecutorPtr executor;

    int max_error_routing_depth;

    const std::string& name() const
    {
      return metadata.name;
    }
  };

  namespace detail {

    template <typename, template <typename...> class>
    struct is_specialization : std::false_type {};

    template <template <typename...> class Tpl, typename... Args>
    struct is_specialization<Tpl<Args...>, Tpl> : std::true_type {};

    template <typename R, typename = void>
    struct is_completable_subtype : std::false_type {};

    template <typename R>
    struct is_completable_subtype<R, std::void_t<typename R::value_type>>
        : std::bool_constant<
              std::is_base_of_v<CompletableFuture<typename R::value_type>, R> &&
              !std::is_same_v<CompletableFuture<typename R::value_type>, R>> {};

  } // namespace detail

  template <typename R>
  constexpr ReturnKind return_kind_of()
  {
    if constexpr (std::is_void_v<R>) {
      return ReturnKind::VOID;
    } else if constexpr (detail::is_specialization<R, std::optional>::value) {
      return ReturnKind::OPTIONAL;
    } else if constexpr (detail::is_specialization<R, std::future>::value) {
      return ReturnKind::FUTURE;
    } else if constexpr (detail::is_specialization<R, ListenableFuture>::value) {
      return ReturnKind::LISTENABLE_FUTURE;
    } else if constexpr (detail::is_specialization<R, CompletableFuture>::value) {
      return ReturnKind::COMPLETABLE_FUTURE;
    } else if constexpr (detail::is_completable_subtype<R>::value) {
      return ReturnKind::COMPLETABLE_FUTURE_SUBTYPE;
    } else if constexpr (detail::is_specialization<R, Single>::value) {
      return ReturnKind::SINGLE;
    } else {
      return ReturnKind::VALUE;
    }
  }

  template <typename Sig>
  struct signature_traits;

  template <typename R, typename... Args>
  struct signature_traits<R(Args...)> {
    using return_type = R;
    static constexpr size_t arity = sizeof...(Args);
    static constexpr ReturnKind return_kind = return_kind_of<R>();
  };

  template <typename Sig>
  MethodMetadata metadata_of(std::string name, std::vector<ExceptionDeclaration> exceptions = {})
  {
    using traits = signature_traits<Sig>;
    return MethodMetadata{
        std::move(name), traits::return_kind, std::type_index{typeid(Sig)}, traits::arity,
        std::move(exceptions)
    };
  }

} // namespace conduit::gateway

#endif
