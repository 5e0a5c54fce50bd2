#ifndef CONDUIT_GATEWAY_ENGINE_HPP
#define CONDUIT_GATEWAY_ENGINE_HPP

#include <conduit/gateway/correlator.hpp>
#include <conduit/gateway/mapper.hpp>
#include <conduit/gateway/method.hpp>
#include <conduit/messaging/channel.hpp>

#include <any>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace conduit::gateway {

  struct Invocation {

    using clock_t = std::chrono::high_resolution_clock;

    Invocation(std::shared_ptr<const ResolvedMethod> method, std::vector<std::any> arguments)
        : method(std::move(method)), arguments(std::move(arguments))
    {
    }

    std::shared_ptr<const ResolvedMethod> method;
    std::vector<std::any> arguments;

    // Correlation identifier of the request; empty for send-only and receive-only calls.
    std::string id;

    clock_t::time_point begin;
    clock_t::time_point end;
  };

  /**
   * Destination of failures that happened after a fire-and-forget call returned.
   *
   * Forwards error-indicator messages to the target channel, without an error
   * channel of their own. Without a target, or when forwarding fails, the failure
   * is logged.
   */
  class SendFailureChannel : public messaging::MessageChannel {
  public:
    SendFailureChannel(std::string method, messaging::ChannelPtr target);

    bool send(const messaging::MessagePtr& msg, messaging::timeout_t timeout = std::nullopt) override;

    std::string_view name() const override
    {
      return _name;
    }

  private:
    std::string _name;
    messaging::ChannelPtr _target;

    std::shared_ptr<spdlog::logger> _logger;
  };

  /**
   * Executes one invocation on the calling thread: mapping, dispatch, and reply
   * processing. Completion strategies decide on which thread this runs.
   *
   * The returned value is the reply payload; an empty value means no reply
   * arrived, or the method does not receive one.
   */
  class Engine {
  public:
    Engine(std::shared_ptr<ArgumentMapper> mapper, std::shared_ptr<PendingRegistry> registry);

    std::any invoke(Invocation& invocation);

    const ReplyCorrelator& correlator() const
    {
      return _correlator;
    }

  private:
    std::any _send(const ResolvedMethod& method, const messaging::MessagePtr& request);

    std::any _receive(const ResolvedMethod& method);

    std::any _send_and_receive(
        const ResolvedMethod& method, const messaging::MessagePtr& request, Invocation& invocation
    );

    // Sends with a private reply destination and waits for the reply.
    messaging::MessagePtr _exchange(
        const ResolvedMethod& method, const messaging::ChannelPtr& channel,
        const messaging::MessagePtr& request, std::string* id
    );

    std::any _process_reply(
        const ResolvedMethod& method, const messaging::MessagePtr& reply,
        const messaging::MessagePtr& request, int depth
    );

    // Raises the unwrapped failure, or returns the result of the error flow.
    std::any _handle_failure(
        const ResolvedMethod& method, std::exception_ptr exc, const messaging::MessagePtr& request,
        int depth
    );

    std::shared_ptr<ArgumentMapper> _mapper;
    ReplyCorrelator _correlator;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace conduit::gateway

#endif
