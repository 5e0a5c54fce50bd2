#include <conduit/messaging/channel.hpp>

#include <conduit/common/exceptions.hpp>
#include <conduit/common/util.hpp>
#include <conduit/messaging/exceptions.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace conduit::messaging {

  namespace {

    void handle_direct(const MessageHandler& handler, const MessagePtr& msg, std::string_view channel)
    {
      try {
        handler(msg);
      } catch (const MessagingException&) {
        throw;
      } catch (...) {
        std::throw_with_nested(MessageHandlingException{
            fmt::format("Handler of channel {} failed to process message {}", channel, msg->id()),
            msg
        });
      }
    }

  } // namespace

  DirectChannel::DirectChannel(std::string name) : _name(std::move(name)) {}

  bool DirectChannel::send(const MessagePtr& msg, timeout_t)
  {
    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock{_handlers_lock};
      if (_handlers.empty()) {
        throw MessageDispatchingException{
            fmt::format("Dispatcher of channel {} has no subscribers", _name), msg
        };
      }
      handler = _handlers[_next_handler++ % _handlers.size()];
    }

    handle_direct(handler, msg, _name);
    return true;
  }

  void DirectChannel::subscribe(MessageHandler handler)
  {
    std::lock_guard<std::mutex> lock{_handlers_lock};
    _handlers.emplace_back(std::move(handler));
  }

  size_t DirectChannel::subscribers() const
  {
    std::lock_guard<std::mutex> lock{_handlers_lock};
    return _handlers.size();
  }

  ExecutorChannel::ExecutorChannel(
      std::string name, ExecutorPtr executor, ChannelPtr default_error_channel
  )
      : _name(std::move(name)), _executor(std::move(executor)),
        _default_error_channel(std::move(default_error_channel))
  {
    if (!_executor) {
      throw common::InvalidConfigurationError{
          fmt::format("Executor channel {} requires an executor", _name)
      };
    }
    _logger = common::util::create_logger(fmt::format("ExecutorChannel-{}", _name));
  }

  bool ExecutorChannel::send(const MessagePtr& msg, timeout_t)
  {
    MessageHandler handler;
    {
      std::lock_guard<std::mutex> lock{_handlers_lock};
      if (_handlers.empty()) {
        throw MessageDispatchingException{
            fmt::format("Dispatcher of channel {} has no subscribers", _name), msg
        };
      }
      handler = _handlers[_next_handler++ % _handlers.size()];
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Handing off message {}", msg->id());
    // The task must not depend on the lifetime of the channel.
    _executor->execute([handler = std::move(handler), msg, name = _name, logger = _logger,
                        error_channel = _default_error_channel]() {
      try {
        handle_direct(handler, msg, name);
      } catch (...) {
        _publish_error(logger, error_channel, msg, std::current_exception());
      }
    });
    return true;
  }

  void ExecutorChannel::_publish_error(
      const std::shared_ptr<spdlog::logger>& logger, const ChannelPtr& default_error_channel,
      const MessagePtr& msg, std::exception_ptr exc
  )
  {
    ChannelPtr error_channel = msg->error_channel();
    if (!error_channel) {
      error_channel = default_error_channel;
    }

    if (!error_channel) {
      logger->error(
          "Handling of message {} failed and no error channel is available: {}", msg->id(),
          common::util::describe(exc)
      );
      return;
    }

    auto error_msg = MessageBuilder::error(exc, msg).build();
    try {
      if (!error_channel->send(error_msg)) {
        logger->error(
            "Error channel {} rejected failure of message {}", error_channel->name(), msg->id()
        );
      }
    } catch (const std::exception& send_exc) {
      logger->error(
          "Could not publish failure of message {} to {}: {}, original failure: {}", msg->id(),
          error_channel->name(), send_exc.what(), common::util::describe(exc)
      );
    }
  }

  void ExecutorChannel::subscribe(MessageHandler handler)
  {
    std::lock_guard<std::mutex> lock{_handlers_lock};
    _handlers.emplace_back(std::move(handler));
  }

  size_t ExecutorChannel::subscribers() const
  {
    std::lock_guard<std::mutex> lock{_handlers_lock};
    return _handlers.size();
  }

  QueueChannel::QueueChannel(std::string name, size_t capacity)
      : _name(std::move(name)), _capacity(capacity)
  {
  }

  bool QueueChannel::send(const MessagePtr& msg, timeout_t timeout)
  {
    std::unique_lock<std::mutex> lock{_lock};

    if (_capacity > 0) {
      auto has_space = [this]() { return _queue.size() < _capacity; };
      if (timeout.has_value()) {
        if (!_not_full.wait_for(lock, timeout.value(), has_space)) {
          return false;
        }
      } else {
        _not_full.wait(lock, has_space);
      }
    }

    _queue.push_back(msg);
    lock.unlock();
    _not_empty.notify_one();
    return true;
  }

  MessagePtr QueueChannel::receive(timeout_t timeout)
  {
    std::unique_lock<std::mutex> lock{_lock};

    auto has_data = [this]() { return !_queue.empty(); };
    if (timeout.has_value()) {
      if (!_not_empty.wait_for(lock, timeout.value(), has_data)) {
        return nullptr;
      }
    } else {
      _not_empty.wait(lock, has_data);
    }

    auto msg = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _not_full.notify_one();
    return msg;
  }

  size_t QueueChannel::size() const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _queue.size();
  }

  void ChannelResolver::add(ChannelPtr channel)
  {
    std::string name{channel->name()};
    auto [it, success] = _channels.try_emplace(name, std::move(channel));
    if (!success) {
      throw common::ObjectExists{fmt::format("Channel {} is already registered", name)};
    }
  }

  ChannelPtr ChannelResolver::resolve(const std::string& name) const
  {
    auto it = _channels.find(name);
    if (it == _channels.end()) {
      throw common::ObjectDoesNotExist{fmt::format("Channel {} is not registered", name)};
    }
    return (*it).second;
  }

  bool ChannelResolver::contains(const std::string& name) const
  {
    return _channels.find(name) != _channels.end();
  }

} // namespace conduit::messaging
