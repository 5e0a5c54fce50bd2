#include <conduit/messaging/executor.hpp>

namespace conduit::messaging {

  ThreadPoolExecutor::ThreadPoolExecutor(int threads)
      : _threads(threads), _pool(static_cast<BS::concurrency_t>(threads))
  {
  }

  void ThreadPoolExecutor::execute(task_t task)
  {
    _pool.detach_task(std::move(task));
  }

  void ThreadPoolExecutor::wait()
  {
    _pool.wait();
  }

} // namespace conduit::messaging
