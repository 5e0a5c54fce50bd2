#ifndef CONDUIT_ADAPTER_SESSION_HPP
#define CONDUIT_ADAPTER_SESSION_HPP

#include <conduit/messaging/message.hpp>

#include <any>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::adapter {

  // Frame header names.
  namespace frame {

    constexpr char DESTINATION[] = "destination";
    constexpr char RECEIPT[] = "receipt";
    // Error text of frames without a body.
    constexpr char MESSAGE[] = "message";

  } // namespace frame

  // Handle of a sent frame, completed when the broker acknowledges it.
  struct Receiptable {

    virtual ~Receiptable() = default;

    // Empty when the session does not request receipts.
    virtual std::optional<std::string> receipt_id() const = 0;

    virtual void add_receipt_task(std::function<void()> task) = 0;

    virtual void add_receipt_lost_task(std::function<void()> task) = 0;
  };

  struct Session {

    virtual ~Session() = default;

    virtual std::string_view id() const = 0;

    virtual bool is_connected() const = 0;

    virtual std::shared_ptr<Receiptable>
    send(const messaging::Headers& headers, const std::any& payload) = 0;
  };

  // Callbacks of a connection; invoked on transport threads.
  struct SessionHandler {

    virtual ~SessionHandler() = default;

    virtual void after_connected(std::shared_ptr<Session> session) = 0;

    virtual void handle_frame(const messaging::Headers& headers, const std::any& payload) = 0;

    virtual void handle_exception(
        const std::shared_ptr<Session>& session, const messaging::Headers& headers,
        std::exception_ptr exc
    ) = 0;

    virtual void handle_transport_error(const std::shared_ptr<Session>& session, std::exception_ptr exc) = 0;
  };

  /**
   * Owner of the broker connection.
   *
   * Handlers must stay alive until they are disconnected.
   */
  struct SessionManager {

    virtual ~SessionManager() = default;

    virtual bool is_connected() const = 0;

    virtual void connect(SessionHandler& handler) = 0;

    virtual void disconnect(SessionHandler& handler) = 0;
  };

} // namespace conduit::adapter

#endif
