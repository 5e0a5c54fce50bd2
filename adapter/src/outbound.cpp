#include <conduit/adapter/outbound.hpp>

#include <conduit/common/exceptions.hpp>
#include <conduit/common/util.hpp>
#include <conduit/messaging/exceptions.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace conduit::adapter {

  namespace {

    bool is_local_header(const std::string& name)
    {
      return name == messaging::headers::ID || name == messaging::headers::TIMESTAMP ||
             name == messaging::headers::REPLY_CHANNEL || name == messaging::headers::ERROR_CHANNEL;
    }

  } // namespace

  messaging::Headers DefaultHeaderFilter::to_frame(const messaging::Headers& headers) const
  {
    messaging::Headers result;
    for (const auto& [name, value] : headers) {
      if (is_local_header(name) || value.type() != typeid(std::string)) {
        continue;
      }
      result.emplace(name, value);
    }
    return result;
  }

  messaging::Headers DefaultHeaderFilter::from_frame(const messaging::Headers& headers) const
  {
    messaging::Headers result;
    for (const auto& [name, value] : headers) {
      if (!is_local_header(name)) {
        result.emplace(name, value);
      }
    }
    return result;
  }

  OutboundSessionHandler::OutboundSessionHandler(std::shared_ptr<SessionManager> manager)
      : _manager(std::move(manager)), _filter(std::make_shared<DefaultHeaderFilter>()),
        _connect_timeout(DEFAULT_CONNECT_TIMEOUT)
  {
    if (!_manager) {
      throw common::InvalidConfigurationError{"Outbound handler requires a session manager"};
    }
    _logger = common::util::create_logger("OutboundSessionHandler");
  }

  void OutboundSessionHandler::destination(const std::string& destination)
  {
    if (destination.empty()) {
      throw common::InvalidConfigurationError{"Destination must not be empty"};
    }
    _destination = [destination](const messaging::MessagePtr&) {
      return std::optional<std::string>{destination};
    };
  }

  void OutboundSessionHandler::destination(destination_t destination)
  {
    if (!destination) {
      throw common::InvalidConfigurationError{"Destination function must not be empty"};
    }
    _destination = std::move(destination);
  }

  void OutboundSessionHandler::header_filter(std::shared_ptr<HeaderFilter> filter)
  {
    if (!filter) {
      throw common::InvalidConfigurationError{"Header filter must not be null"};
    }
    _filter = std::move(filter);
  }

  void OutboundSessionHandler::event_publisher(std::shared_ptr<EventPublisher> publisher)
  {
    _publisher = std::move(publisher);
  }

  void OutboundSessionHandler::connect_timeout(std::chrono::milliseconds timeout)
  {
    _connect_timeout = timeout;
  }

  messaging::MessageHandler OutboundSessionHandler::handler()
  {
    return [this](const messaging::MessagePtr& msg) { handle(msg); };
  }

  void OutboundSessionHandler::handle(const messaging::MessagePtr& msg)
  {
    std::shared_ptr<Session> session;
    try {
      session = _connect_if_necessary();
    } catch (...) {
      std::throw_with_nested(messaging::MessageDeliveryException{
          "Outbound session handler could not deliver the message", msg
      });
    }

    messaging::Headers frame_headers = _filter->to_frame(msg->headers());
    if (frame_headers.find(frame::DESTINATION) == frame_headers.end()) {

      std::optional<std::string> destination;
      if (_destination) {
        destination = _destination(msg);
      }
      if (!destination) {
        throw common::InvalidConfigurationError{
            "Message has no destination header and no default destination is configured"
        };
      }
      frame_headers.emplace(frame::DESTINATION, destination.value());
    }
    std::string destination = std::any_cast<std::string>(frame_headers[frame::DESTINATION]);

    auto receiptable = session->send(frame_headers, msg->payload());
    if (!receiptable) {
      return;
    }

    auto receipt_id = receiptable->receipt_id();
    if (!receipt_id) {
      return;
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Sent frame to {}, waiting for receipt {}", destination, receipt_id.value());

    auto publisher = _publisher;
    if (publisher) {
      receiptable->add_receipt_task([publisher, destination, id = receipt_id.value(), msg]() {
        publisher->publish(ReceiptEvent{destination, id, false, msg});
      });
    }
    receiptable->add_receipt_lost_task(
        [publisher, logger = _logger, destination, id = receipt_id.value(), msg]() {
          if (publisher) {
            publisher->publish(ReceiptEvent{destination, id, true, msg});
          } else {
            logger->error("Receipt {} is lost for message {} on destination {}", id, msg->id(), destination);
          }
        }
    );
  }

  std::shared_ptr<Session> OutboundSessionHandler::_connect_if_necessary()
  {
    std::lock_guard<std::mutex> connect_guard{_connect_lock};

    {
      std::lock_guard<std::mutex> guard{_state_lock};
      if (_session && _manager->is_connected()) {
        return _session;
      }
    }

    _manager->disconnect(*this);
    _manager->connect(*this);

    std::unique_lock<std::mutex> lock{_state_lock};
    bool signalled =
        _connected_cv.wait_for(lock, _connect_timeout, [this]() { return _connected_signals > 0; });
    if (signalled) {
      --_connected_signals;
    }

    if (!signalled || !_session) {

      if (_transport_error) {

        try {
          std::rethrow_exception(_transport_error);
        } catch (const messaging::ConnectionLostException&) {
          throw;
        } catch (const std::exception& exc) {
          throw messaging::ConnectionLostException{exc.what()};
        } catch (...) {
          throw messaging::ConnectionLostException{"Unknown transport error"};
        }
      }

      throw messaging::ConnectionLostException{
          fmt::format("Failed to obtain a session within {} ms", _connect_timeout.count())
      };
    }

    return _session;
  }

  void OutboundSessionHandler::start()
  {
    _running = true;
  }

  void OutboundSessionHandler::stop()
  {
    _running = false;
    _manager->disconnect(*this);
  }

  bool OutboundSessionHandler::is_running() const
  {
    return _running;
  }

  void OutboundSessionHandler::after_connected(std::shared_ptr<Session> session)
  {
    {
      std::lock_guard<std::mutex> guard{_state_lock};
      _transport_error = nullptr;
      _session = std::move(session);
      ++_connected_signals;
    }
    _connected_cv.notify_all();
  }

  void OutboundSessionHandler::handle_frame(const messaging::Headers& headers, const std::any& payload)
  {
    std::any body = payload;
    if (!body.has_value()) {
      auto it = headers.find(frame::MESSAGE);
      if (it != headers.end()) {
        body = (*it).second;
      }
    }
    if (!body.has_value()) {
      return;
    }

    auto failed = messaging::MessageBuilder::with_payload(std::move(body))
                      .headers(_filter->from_frame(headers))
                      .build();
    auto exc = std::make_exception_ptr(
        messaging::MessageDeliveryException{"Frame handling error", failed}
    );

    _logger->error("Frame handling error for message {}", failed->id());
    if (_publisher) {
      _publisher->publish(ExceptionEvent{exc, failed});
    }
  }

  void OutboundSessionHandler::handle_exception(
      const std::shared_ptr<Session>& session, const messaging::Headers&, std::exception_ptr exc
  )
  {
    _logger->error(
        "Exception in session {}: {}", session ? session->id() : "<none>",
        common::util::describe(exc)
    );
  }

  void OutboundSessionHandler::handle_transport_error(
      const std::shared_ptr<Session>& session, std::exception_ptr exc
  )
  {
    _logger->error(
        "Transport error in session {}: {}", session ? session->id() : "<none>",
        common::util::describe(exc)
    );

    std::lock_guard<std::mutex> guard{_state_lock};
    _transport_error = std::move(exc);
    _session = nullptr;
  }

} // namespace conduit::adapter
