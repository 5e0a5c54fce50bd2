#include <conduit/gateway/mapper.hpp>

#include <conduit/messaging/exceptions.hpp>

#include <fmt/format.h>

namespace conduit::gateway {

  messaging::MessagePtr
  DefaultArgumentMapper::to_message(const ResolvedMethod& method, std::vector<std::any>&& args)
  {
    if (args.empty()) {

      if (!method.payload) {
        throw messaging::MessageMappingException{
            fmt::format("Method {} has no arguments and no configured payload", method.name())
        };
      }

      std::any payload;
      try {
        payload = method.payload();
      } catch (...) {
        std::throw_with_nested(messaging::MessageMappingException{
            fmt::format("Payload supplier of method {} failed", method.name())
        });
      }
      return messaging::MessageBuilder::with_payload(std::move(payload))
          .headers(method.headers)
          .build();
    }

    if (args.size() == 1) {
      auto* msg = std::any_cast<messaging::MessagePtr>(&args[0]);
      if (msg) {
        if (!*msg) {
          throw messaging::MessageMappingException{
              fmt::format("Method {} received a null message", method.name())
          };
        }
        auto builder = messaging::MessageBuilder::from_message(**msg);
        for (const auto& [name, value] : method.headers) {
          builder.header_if_absent(name, value);
        }
        return builder.build();
      }
    }

    if (args.size() - 1 > method.argument_headers.size()) {
      throw messaging::MessageMappingException{fmt::format(
          "Method {} received {} arguments, but only {} argument headers are configured",
          method.name(), args.size(), method.argument_headers.size()
      )};
    }

    auto builder = messaging::MessageBuilder::with_payload(std::move(args[0]));
    for (size_t i = 1; i < args.size(); ++i) {
      builder.header(method.argument_headers[i - 1], std::move(args[i]));
    }
    for (const auto& [name, value] : method.headers) {
      builder.header_if_absent(name, value);
    }

    return builder.build();
  }

} // namespace conduit::gateway
