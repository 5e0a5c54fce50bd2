#ifndef CONDUIT_ADAPTER_OUTBOUND_HPP
#define CONDUIT_ADAPTER_OUTBOUND_HPP

#include <conduit/adapter/session.hpp>
#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/message.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace conduit::adapter {

  struct ReceiptEvent {
    std::string destination;
    std::string receipt_id;
    bool lost;
    messaging::MessagePtr message;
  };

  struct ExceptionEvent {
    std::exception_ptr cause;
    messaging::MessagePtr message;
  };

  struct EventPublisher {

    virtual ~EventPublisher() = default;

    virtual void publish(const ReceiptEvent& event) = 0;

    virtual void publish(const ExceptionEvent& event) = 0;
  };

  // Maps message headers to frame headers and back.
  struct HeaderFilter {

    virtual ~HeaderFilter() = default;

    virtual messaging::Headers to_frame(const messaging::Headers& headers) const = 0;

    virtual messaging::Headers from_frame(const messaging::Headers& headers) const = 0;
  };

  // Copies string-valued headers, except the ones describing the local message flow.
  class DefaultHeaderFilter : public HeaderFilter {
  public:
    messaging::Headers to_frame(const messaging::Headers& headers) const override;

    messaging::Headers from_frame(const messaging::Headers& headers) const override;
  };

  /**
   * Publishes messages of a channel as frames of a broker session.
   *
   * The session is established on the first message and re-established when the
   * session manager reports the connection as lost. Every message waits at most
   * the connect timeout for the session.
   */
  class OutboundSessionHandler : public SessionHandler {
  public:
    static constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{3000};

    using destination_t = std::function<std::optional<std::string>(const messaging::MessagePtr&)>;

    OutboundSessionHandler(std::shared_ptr<SessionManager> manager);

    void destination(const std::string& destination);

    // Evaluated for messages without a destination header.
    void destination(destination_t destination);

    void header_filter(std::shared_ptr<HeaderFilter> filter);

    void event_publisher(std::shared_ptr<EventPublisher> publisher);

    void connect_timeout(std::chrono::milliseconds timeout);

    // Throws MessageDeliveryException when no session can be established.
    void handle(const messaging::MessagePtr& msg);

    // Adapter for channel subscriptions; the handler must outlive the channel.
    messaging::MessageHandler handler();

    void start();

    void stop();

    bool is_running() const;

    void after_connected(std::shared_ptr<Session> session) override;

    void handle_frame(const messaging::Headers& headers, const std::any& payload) override;

    void handle_exception(
        const std::shared_ptr<Session>& session, const messaging::Headers& headers,
        std::exception_ptr exc
    ) override;

    void handle_transport_error(const std::shared_ptr<Session>& session, std::exception_ptr exc) override;

  private:
    std::shared_ptr<Session> _connect_if_necessary();

    std::shared_ptr<SessionManager> _manager;
    std::shared_ptr<HeaderFilter> _filter;
    std::shared_ptr<EventPublisher> _publisher;
    destination_t _destination;
    std::chrono::milliseconds _connect_timeout;

    // Serializes connection attempts.
    std::mutex _connect_lock;

    // Protects the session state and the connection signal.
    std::mutex _state_lock;
    std::condition_variable _connected_cv;
    int _connected_signals = 0;
    std::shared_ptr<Session> _session;
    std::exception_ptr _transport_error;

    std::atomic<bool> _running{false};

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace conduit::adapter

#endif
