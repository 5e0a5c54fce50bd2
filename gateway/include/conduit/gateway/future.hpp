#ifndef CONDUIT_GATEWAY_FUTURE_HPP
#define CONDUIT_GATEWAY_FUTURE_HPP

#include <conduit/common/exceptions.hpp>
#include <conduit/messaging/executor.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace conduit::gateway {

  struct CancellationError : common::ConduitException {

    CancellationError() : common::ConduitException("Task was cancelled before it started") {}
  };

  // Futures of void carry no value.
  template <typename T>
  using stored_t = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

  namespace detail {

    template <typename T>
    struct FutureState {

      enum class Status { PENDING, RUNNING, VALUE, ERROR, CANCELLED };

      std::mutex lock;
      std::condition_variable cv;
      Status status = Status::PENDING;
      std::optional<stored_t<T>> value;
      std::exception_ptr error;
      std::vector<std::function<void()>> callbacks;

      bool done() const
      {
        return status == Status::VALUE || status == Status::ERROR || status == Status::CANCELLED;
      }

      // Returns false when the result has already been set or the setter declined.
      template <typename F>
      bool finish(F&& setter)
      {
        std::vector<std::function<void()>> to_run;
        {
          std::lock_guard<std::mutex> guard{lock};
          if (done() || !setter()) {
            return false;
          }
          to_run.swap(callbacks);
        }
        cv.notify_all();
        for (auto& callback : to_run) {
          callback();
        }
        return true;
      }
    };

  } // namespace detail

  /**
   * Shared state of a single asynchronous result.
   *
   * Handles are cheap to copy and all copies observe the same result. A default
   * constructed handle is not valid and holds no state.
   */
  template <typename T>
  class BasicFuture {
  public:
    using value_type = T;
    using state_t = detail::FutureState<T>;
    using Status = typename state_t::Status;

    BasicFuture() = default;

    bool valid() const
    {
      return _state != nullptr;
    }

    bool is_done() const
    {
      std::lock_guard<std::mutex> guard{_state->lock};
      return _state->done();
    }

    bool is_cancelled() const
    {
      std::lock_guard<std::mutex> guard{_state->lock};
      return _state->status == Status::CANCELLED;
    }

    bool is_completed_exceptionally() const
    {
      std::lock_guard<std::mutex> guard{_state->lock};
      return _state->status == Status::ERROR || _state->status == Status::CANCELLED;
    }

    // Succeeds only while the task has not started.
    bool cancel()
    {
      return _state->finish([this]() {
        if (_state->status != Status::PENDING) {
          return false;
        }
        _state->status = Status::CANCELLED;
        _state->error = std::make_exception_ptr(CancellationError{});
        return true;
      });
    }

    void wait() const
    {
      std::unique_lock<std::mutex> guard{_state->lock};
      _state->cv.wait(guard, [this]() { return _state->done(); });
    }

    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const
    {
      std::unique_lock<std::mutex> guard{_state->lock};
      return _state->cv.wait_for(guard, timeout, [this]() { return _state->done(); });
    }

    // Null unless completed exceptionally or cancelled.
    std::exception_ptr exception() const
    {
      std::lock_guard<std::mutex> guard{_state->lock};
      return _state->error;
    }

    T get() const
    {
      wait();
      std::lock_guard<std::mutex> guard{_state->lock};
      if (_state->error) {
        std::rethrow_exception(_state->error);
      }
      if constexpr (!std::is_void_v<T>) {
        return _state->value.value();
      }
    }

    // Invoked on the completing thread, or immediately when already done.
    void when_complete(std::function<void(const BasicFuture<T>&)> callback) const
    {
      {
        std::lock_guard<std::mutex> guard{_state->lock};
        if (!_state->done()) {
          _state->callbacks.emplace_back([callback, self = *this]() { callback(self); });
          return;
        }
      }
      callback(*this);
    }

    // Transition PENDING -> RUNNING; false when the handle was cancelled or completed.
    bool start()
    {
      std::lock_guard<std::mutex> guard{_state->lock};
      if (_state->status != Status::PENDING) {
        return false;
      }
      _state->status = Status::RUNNING;
      return true;
    }

    bool set_value(stored_t<T> value)
    {
      return _state->finish([this, &value]() {
        _state->value = std::move(value);
        _state->status = Status::VALUE;
        return true;
      });
    }

    bool set_exception(std::exception_ptr exc)
    {
      return _state->finish([this, &exc]() {
        _state->error = std::move(exc);
        _state->status = Status::ERROR;
        return true;
      });
    }

  protected:
    void _initialize()
    {
      _state = std::make_shared<state_t>();
    }

    std::shared_ptr<state_t> _state;
  };

  // Result handle that any party may complete; the first completion wins.
  template <typename T>
  class CompletableFuture : public BasicFuture<T> {
  public:
    CompletableFuture() = default;

    static CompletableFuture create()
    {
      CompletableFuture future;
      future._initialize();
      return future;
    }

    static CompletableFuture completed(stored_t<T> value)
    {
      auto future = create();
      future.complete(std::move(value));
      return future;
    }

    bool complete(stored_t<T> value)
    {
      return this->set_value(std::move(value));
    }

    bool complete_exceptionally(std::exception_ptr exc)
    {
      return this->set_exception(std::move(exc));
    }
  };

  // Result handle of a task submitted through the listenable path of an executor.
  template <typename T>
  class ListenableFuture : public BasicFuture<T> {
  public:
    ListenableFuture() = default;

    static ListenableFuture create()
    {
      ListenableFuture future;
      future._initialize();
      return future;
    }

    void add_callback(
        std::function<void(const stored_t<T>&)> on_success,
        std::function<void(std::exception_ptr)> on_failure
    ) const
    {
      this->when_complete([on_success = std::move(on_success),
                           on_failure = std::move(on_failure)](const BasicFuture<T>& future) {
        std::exception_ptr error = future.exception();
        if (error) {
          on_failure(error);
        } else {
          if constexpr (std::is_void_v<T>) {
            on_success(std::monostate{});
          } else {
            on_success(future.get());
          }
        }
      });
    }
  };

  namespace detail {

    template <typename T, typename Future>
    void run_into(Future& future, const std::function<T()>& task)
    {
      if (!future.start()) {
        return;
      }
      try {
        if constexpr (std::is_void_v<T>) {
          task();
          future.set_value(std::monostate{});
        } else {
          future.set_value(task());
        }
      } catch (...) {
        future.set_exception(std::current_exception());
      }
    }

  } // namespace detail

  template <typename T>
  std::future<T> submit(messaging::Executor& executor, std::function<T()> task)
  {
    auto packaged = std::make_shared<std::packaged_task<T()>>(std::move(task));
    auto future = packaged->get_future();
    executor.execute([packaged]() { (*packaged)(); });
    return future;
  }

  template <typename T>
  ListenableFuture<T> submit_listenable(messaging::Executor& executor, std::function<T()> task)
  {
    auto future = ListenableFuture<T>::create();
    executor.execute([future, task = std::move(task)]() mutable {
      detail::run_into<T>(future, task);
    });
    return future;
  }

  template <typename T>
  CompletableFuture<T> supply_async(messaging::Executor& executor, std::function<T()> task)
  {
    auto future = CompletableFuture<T>::create();
    executor.execute([future, task = std::move(task)]() mutable {
      detail::run_into<T>(future, task);
    });
    return future;
  }

} // namespace conduit::gateway

#endif
