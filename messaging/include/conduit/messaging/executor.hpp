#ifndef CONDUIT_MESSAGING_EXECUTOR_HPP
#define CONDUIT_MESSAGING_EXECUTOR_HPP

#include <functional>
#include <memory>

#include <BS_thread_pool.hpp>

namespace conduit::messaging {

  struct Executor {

    using task_t = std::function<void()>;

    virtual ~Executor() = default;

    virtual void execute(task_t task) = 0;

    // True when tasks can be submitted through the listenable path,
    // i.e. the completion of a task can be observed with callbacks.
    virtual bool supports_listenable() const
    {
      return false;
    }
  };

  using ExecutorPtr = std::shared_ptr<Executor>;

  class ThreadPoolExecutor : public Executor {
  public:
    static constexpr int DEFAULT_THREADS_NUMBER = 4;

    ThreadPoolExecutor(int threads = DEFAULT_THREADS_NUMBER);

    void execute(task_t task) override;

    bool supports_listenable() const override
    {
      return true;
    }

    // Blocks until all submitted tasks are finished.
    void wait();

    int threads() const
    {
      return _threads;
    }

  private:
    int _threads;

    BS::thread_pool _pool;
  };

  // Runs the task on the submitting thread.
  struct CallerRunsExecutor : Executor {

    void execute(task_t task) override
    {
      task();
    }

    bool supports_listenable() const override
    {
      return true;
    }
  };

} // namespace conduit::messaging

#endif
