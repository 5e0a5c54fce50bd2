#include <conduit/gateway/engine.hpp>

#include <conduit/common/util.hpp>
#include <conduit/gateway/unwrapper.hpp>
#include <conduit/messaging/exceptions.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace conduit::gateway {

  SendFailureChannel::SendFailureChannel(std::string method, messaging::ChannelPtr target)
      : _name(fmt::format("{}.send-failures", method)), _target(std::move(target))
  {
    _logger = common::util::create_logger("SendFailureChannel");
  }

  bool SendFailureChannel::send(const messaging::MessagePtr& msg, messaging::timeout_t timeout)
  {
    if (_target) {
      // Failures of the error flow itself are logged, not routed back here.
      auto forwarded = messaging::MessageBuilder::from_message(*msg)
                           .remove_header(messaging::headers::ERROR_CHANNEL)
                           .build();
      try {
        if (_target->send(forwarded, timeout)) {
          return true;
        }
        _logger->error(
            "Error channel {} rejected the failure of {}: {}", _target->name(), _name,
            common::util::describe(msg->error())
        );
      } catch (const std::exception& exc) {
        _logger->error(
            "Error channel {} failed while handling the failure of {}: {}, original failure: {}",
            _target->name(), _name, exc.what(), common::util::describe(msg->error())
        );
      }
      return true;
    }

    _logger->error("Failure of {}: {}", _name, common::util::describe(msg->error()));
    return true;
  }

  Engine::Engine(std::shared_ptr<ArgumentMapper> mapper, std::shared_ptr<PendingRegistry> registry)
      : _mapper(std::move(mapper)), _correlator(std::move(registry))
  {
    _logger = common::util::create_logger("Engine");
  }

  std::any Engine::invoke(Invocation& invocation)
  {
    const ResolvedMethod& method = *invocation.method;
    invocation.begin = Invocation::clock_t::now();

    std::any result;
    if (method.mode == InvocationMode::RECEIVE) {
      result = _receive(method);
    } else {

      // Mapping failures are configuration defects and are not unwrapped.
      auto request = _mapper->to_message(method, std::move(invocation.arguments));

      if (method.mode == InvocationMode::SEND) {
        result = _send(method, request);
      } else {
        result = _send_and_receive(method, request, invocation);
      }
    }

    invocation.end = Invocation::clock_t::now();
    SPDLOG_LOGGER_DEBUG(
        _logger, "Invocation {} of {} finished after {} us", invocation.id, method.name(),
        std::chrono::duration_cast<std::chrono::microseconds>(invocation.end - invocation.begin).count()
    );
    return result;
  }

  std::any Engine::_send(const ResolvedMethod& method, const messaging::MessagePtr& request)
  {
    auto msg = messaging::MessageBuilder::from_message(*request)
                   .header_if_absent(messaging::headers::ERROR_CHANNEL, method.send_failure_channel)
                   .build();

    bool sent = false;
    std::exception_ptr failure;
    try {
      sent = method.request_channel->send(msg, method.request_timeout);
    } catch (const messaging::MessageDispatchingException& exc) {
      // Only the refusal of the request channel itself reaches the caller.
      if (exc.failed_message() == msg) {
        throw;
      }
      failure = std::current_exception();
    } catch (...) {
      failure = std::current_exception();
    }

    if (failure) {
      // The caller does not wait for a result; report like an asynchronous failure.
      method.send_failure_channel->send(messaging::MessageBuilder::error(failure, msg).build());
      return {};
    }

    if (!sent) {
      throw messaging::MessageDeliveryException{
          fmt::format(
              "Channel {} did not accept the message of {}", method.request_channel->name(),
              method.name()
          ),
          msg
      };
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Sent {} to {}", method.name(), method.request_channel->name());
    return {};
  }

  std::any Engine::_receive(const ResolvedMethod& method)
  {
    auto channel = std::dynamic_pointer_cast<messaging::PollableChannel>(method.request_channel);
    if (!channel) {
      throw common::InvalidConfigurationError{fmt::format(
          "Method {} receives from {}, which is not pollable", method.name(),
          method.request_channel->name()
      )};
    }

    messaging::MessagePtr reply;
    try {
      reply = channel->receive(method.reply_timeout);
    } catch (...) {
      return _handle_failure(method, std::current_exception(), nullptr, 0);
    }
    return _process_reply(method, reply, nullptr, 0);
  }

  std::any Engine::_send_and_receive(
      const ResolvedMethod& method, const messaging::MessagePtr& request, Invocation& invocation
  )
  {
    messaging::MessagePtr reply;
    try {
      reply = _exchange(method, method.request_channel, request, &invocation.id);
    } catch (...) {
      return _handle_failure(method, std::current_exception(), request, 0);
    }
    return _process_reply(method, reply, request, 0);
  }

  messaging::MessagePtr Engine::_exchange(
      const ResolvedMethod& method, const messaging::ChannelPtr& channel,
      const messaging::MessagePtr& request, std::string* id
  )
  {
    // The slot must exist before the request can be answered.
    auto correlation = _correlator.open();
    if (id) {
      *id = correlation.id;
    }

    auto msg = messaging::MessageBuilder::from_message(*request)
                   .reply_channel(correlation.reply_channel)
                   .error_channel(correlation.reply_channel)
                   .header(messaging::headers::CORRELATION_ID, correlation.id)
                   .build();

    bool sent = false;
    try {
      sent = channel->send(msg, method.request_timeout);
    } catch (...) {
      _correlator.release(correlation);
      throw;
    }

    if (!sent) {
      _correlator.release(correlation);
      throw messaging::MessageDeliveryException{
          fmt::format("Channel {} did not accept the message of {}", channel->name(), method.name()),
          msg
      };
    }

    SPDLOG_LOGGER_DEBUG(
        _logger, "Sent {} to {}, waiting for reply {}", method.name(), channel->name(),
        correlation.id
    );
    return _correlator.await(correlation, method.reply_timeout);
  }

  std::any Engine::_process_reply(
      const ResolvedMethod& method, const messaging::MessagePtr& reply,
      const messaging::MessagePtr& request, int depth
  )
  {
    if (!reply) {
      return {};
    }

    if (reply->is_error()) {
      return _handle_failure(method, reply->error(), request, depth);
    }

    return reply->payload();
  }

  std::any Engine::_handle_failure(
      const ResolvedMethod& method, std::exception_ptr exc, const messaging::MessagePtr& request,
      int depth
  )
  {
    auto declared = ExceptionUnwrapper::find_declared(exc, method.metadata.exceptions);
    if (declared) {
      std::rethrow_exception(declared);
    }

    if (method.error_channel && depth < method.max_error_routing_depth) {

      SPDLOG_LOGGER_DEBUG(
          _logger, "Routing failure of {} to {}: {}", method.name(), method.error_channel->name(),
          common::util::describe(exc)
      );

      auto error_msg = messaging::MessageBuilder::error(exc, request).build();

      messaging::MessagePtr reply;
      try {
        reply = _exchange(method, method.error_channel, error_msg, nullptr);
      } catch (...) {
        return _handle_failure(method, std::current_exception(), request, depth + 1);
      }
      return _process_reply(method, reply, request, depth + 1);
    }

    std::rethrow_exception(ExceptionUnwrapper::fallback(exc));
  }

} // namespace conduit::gateway
