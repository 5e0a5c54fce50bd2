#ifndef CONDUIT_GATEWAY_SINGLE_HPP
#define CONDUIT_GATEWAY_SINGLE_HPP

#include <conduit/common/exceptions.hpp>
#include <conduit/gateway/future.hpp>
#include <conduit/messaging/executor.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>

namespace conduit::gateway {

  class Subscription {
  public:
    Subscription() : _cancelled(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel()
    {
      _cancelled->store(true);
    }

    bool is_cancelled() const
    {
      return _cancelled->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> _cancelled;
  };

  /**
   * Lazily evaluated source of at most one value.
   *
   * Creating a Single does not run anything. Every call to subscribe runs the
   * source once, independently of other subscriptions, and signals exactly one of:
   * success, error, or empty completion. By default the source runs on the
   * subscribing thread.
   */
  template <typename T>
  class Single {
  public:
    using value_type = T;
    using value_t = stored_t<T>;

    struct Observer {
      std::function<void(value_t)> on_success;
      std::function<void(std::exception_ptr)> on_error;
      std::function<void()> on_empty;
    };

    using source_t = std::function<void(const Observer&, const Subscription&)>;

    Single() = default;

    static Single from_callable(std::function<std::optional<value_t>()> callable)
    {
      return Single{[callable = std::move(callable)](const Observer& obs, const Subscription& sub) {
        if (sub.is_cancelled()) {
          return;
        }

        std::optional<value_t> result;
        try {
          result = callable();
        } catch (...) {
          if (!sub.is_cancelled()) {
            obs.on_error(std::current_exception());
          }
          return;
        }

        if (sub.is_cancelled()) {
          return;
        }
        if (result.has_value()) {
          obs.on_success(std::move(result.value()));
        } else if (obs.on_empty) {
          obs.on_empty();
        }
      }};
    }

    static Single just(value_t value)
    {
      return from_callable([value]() { return std::optional<value_t>{value}; });
    }

    static Single empty()
    {
      return from_callable([]() { return std::optional<value_t>{}; });
    }

    // Subscriptions run the source as a task of the executor.
    Single subscribe_on(messaging::ExecutorPtr executor) const
    {
      if (!valid()) {
        return Single{};
      }
      return Single{[source = _source, executor](const Observer& obs, const Subscription& sub) {
        executor->execute([source, obs, sub]() { source(obs, sub); });
      }};
    }

    bool valid() const
    {
      return static_cast<bool>(_source);
    }

    Subscription subscribe(
        std::function<void(value_t)> on_success, std::function<void(std::exception_ptr)> on_error,
        std::function<void()> on_empty = {}
    ) const
    {
      if (!valid()) {
        throw common::InvalidConfigurationError{"Cannot subscribe to a Single without a source"};
      }

      Subscription subscription;
      _source(Observer{std::move(on_success), std::move(on_error), std::move(on_empty)}, subscription);
      return subscription;
    }

    // Subscribes and waits for the signal. Empty completion returns an empty optional.
    std::optional<value_t> block() const
    {
      auto promise = std::make_shared<std::promise<std::optional<value_t>>>();
      auto future = promise->get_future();
      subscribe(
          [promise](value_t value) { promise->set_value(std::move(value)); },
          [promise](std::exception_ptr exc) { promise->set_exception(exc); },
          [promise]() { promise->set_value(std::nullopt); }
      );
      return future.get();
    }

  private:
    explicit Single(source_t source) : _source(std::move(source)) {}

    source_t _source;
  };

} // namespace conduit::gateway

#endif
