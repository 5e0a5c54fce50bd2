#ifndef CONDUIT_MESSAGING_CHANNEL_HPP
#define CONDUIT_MESSAGING_CHANNEL_HPP

#include <conduit/messaging/executor.hpp>
#include <conduit/messaging/message.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace conduit::messaging {

  // Empty optional is an unbounded wait.
  using timeout_t = std::optional<std::chrono::milliseconds>;

  using MessageHandler = std::function<void(const MessagePtr&)>;

  struct MessageChannel {

    virtual ~MessageChannel() = default;

    virtual bool send(const MessagePtr& msg, timeout_t timeout = std::nullopt) = 0;

    virtual std::string_view name() const = 0;
  };

  struct SubscribableChannel : MessageChannel {

    virtual void subscribe(MessageHandler handler) = 0;

    virtual size_t subscribers() const = 0;
  };

  struct PollableChannel : MessageChannel {

    // Returns nullptr when nothing arrived before the timeout.
    virtual MessagePtr receive(timeout_t timeout = std::nullopt) = 0;
  };

  /**
   * Handlers are invoked on the sender's thread, round-robin between subscribers.
   *
   * Handler exceptions propagate to the sender. Exceptions that are not already
   * a MessagingException are wrapped in a MessageHandlingException, with the original
   * exception nested as its cause.
   */
  class DirectChannel : public SubscribableChannel {
  public:
    DirectChannel(std::string name);

    bool send(const MessagePtr& msg, timeout_t timeout = std::nullopt) override;

    void subscribe(MessageHandler handler) override;

    size_t subscribers() const override;

    std::string_view name() const override
    {
      return _name;
    }

  private:
    std::string _name;

    mutable std::mutex _handlers_lock;
    std::vector<MessageHandler> _handlers;
    std::atomic<size_t> _next_handler{};
  };

  /**
   * Handlers are invoked on executor threads; send returns once the message is handed off.
   *
   * A failing handler cannot report to the sender. The failure is sent as an
   * error-indicator message to the error channel of the message, or to the default
   * error channel of this channel. Without either, it is logged.
   */
  class ExecutorChannel : public SubscribableChannel {
  public:
    ExecutorChannel(std::string name, ExecutorPtr executor, ChannelPtr default_error_channel = nullptr);

    bool send(const MessagePtr& msg, timeout_t timeout = std::nullopt) override;

    void subscribe(MessageHandler handler) override;

    size_t subscribers() const override;

    std::string_view name() const override
    {
      return _name;
    }

  private:
    static void _publish_error(
        const std::shared_ptr<spdlog::logger>& logger, const ChannelPtr& default_error_channel,
        const MessagePtr& msg, std::exception_ptr exc
    );

    std::string _name;
    ExecutorPtr _executor;
    ChannelPtr _default_error_channel;

    mutable std::mutex _handlers_lock;
    std::vector<MessageHandler> _handlers;
    std::atomic<size_t> _next_handler{};

    std::shared_ptr<spdlog::logger> _logger;
  };

  // FIFO buffer. Capacity of zero means no bound.
  class QueueChannel : public PollableChannel {
  public:
    QueueChannel(std::string name, size_t capacity = 0);

    bool send(const MessagePtr& msg, timeout_t timeout = std::nullopt) override;

    MessagePtr receive(timeout_t timeout = std::nullopt) override;

    size_t size() const;

    std::string_view name() const override
    {
      return _name;
    }

  private:
    std::string _name;
    size_t _capacity;

    mutable std::mutex _lock;
    std::condition_variable _not_empty;
    std::condition_variable _not_full;
    std::deque<MessagePtr> _queue;
  };

  // Accepts and drops everything.
  struct NullChannel : MessageChannel {

    bool send(const MessagePtr&, timeout_t = std::nullopt) override
    {
      return true;
    }

    std::string_view name() const override
    {
      return "null";
    }
  };

  // Maps configured channel names to instances.
  class ChannelResolver {
  public:
    void add(ChannelPtr channel);

    // Throws ObjectDoesNotExist for unknown names.
    ChannelPtr resolve(const std::string& name) const;

    bool contains(const std::string& name) const;

  private:
    std::unordered_map<std::string, ChannelPtr> _channels;
  };

} // namespace conduit::messaging

#endif
