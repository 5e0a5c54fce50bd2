#ifndef CONDUIT_GATEWAY_MAPPER_HPP
#define CONDUIT_GATEWAY_MAPPER_HPP

#include <conduit/gateway/method.hpp>
#include <conduit/messaging/message.hpp>

#include <any>
#include <vector>

namespace conduit::gateway {

  struct ArgumentMapper {

    virtual ~ArgumentMapper() = default;

    // Throws MessageMappingException when the arguments cannot form a message.
    virtual messaging::MessagePtr
    to_message(const ResolvedMethod& method, std::vector<std::any>&& args) = 0;
  };

  /**
   * Argument layout:
   * - no arguments: the configured payload supplier provides the payload,
   * - a single MessagePtr argument is sent as it is,
   * - otherwise the first argument is the payload and the following ones are
   *   assigned to the configured argument headers, in order.
   *
   * Static headers of the method never override headers set by arguments.
   */
  class DefaultArgumentMapper : public ArgumentMapper {
  public:
    messaging::MessagePtr
    to_message(const ResolvedMethod& method, std::vector<std::any>&& args) override;
  };

} // namespace conduit::gateway

#endif
