#include <conduit/gateway/method.hpp>

namespace conduit::gateway {

  std::string_view to_string(ReturnKind kind)
  {
    switch (kind) {
    case ReturnKind::VOID:
      return "void";
    case ReturnKind::VALUE:
      return "value";
    case ReturnKind::OPTIONAL:
      return "optional";
    case ReturnKind::FUTURE:
      return "future";
    case ReturnKind::LISTENABLE_FUTURE:
      return "listenable-future";
    case ReturnKind::COMPLETABLE_FUTURE:
      return "completable-future";
    case ReturnKind::COMPLETABLE_FUTURE_SUBTYPE:
      return "completable-future-subtype";
    case ReturnKind::SINGLE:
      return "single";
    }
    return "";
  }

  std::string_view to_string(CompletionStrategy strategy)
  {
    switch (strategy) {
    case CompletionStrategy::BLOCKING:
      return "blocking";
    case CompletionStrategy::EXECUTOR_FUTURE:
      return "executor-future";
    case CompletionStrategy::LISTENABLE_FUTURE:
      return "listenable-future";
    case CompletionStrategy::EAGER_COMPLETABLE:
      return "eager-completable";
    case CompletionStrategy::DEFERRED_COMPLETABLE:
      return "deferred-completable";
    case CompletionStrategy::LAZY_SINGLE:
      return "lazy-single";
    }
    return "";
  }

  std::string_view to_string(InvocationMode mode)
  {
    switch (mode) {
    case InvocationMode::SEND_AND_RECEIVE:
      return "send-and-receive";
    case InvocationMode::SEND:
      return "send";
    case InvocationMode::RECEIVE:
      return "receive";
    }
    return "";
  }

} // namespace conduit::gateway
