#ifndef CONDUIT_MESSAGING_EXCEPTIONS_HPP
#define CONDUIT_MESSAGING_EXCEPTIONS_HPP

#include <conduit/common/exceptions.hpp>
#include <conduit/messaging/message.hpp>

namespace conduit::messaging {

  // Wrapper type of the messaging layer. The underlying cause, if any, is attached
  // with std::throw_with_nested.
  struct MessagingException : common::ConduitException {

    MessagingException(const std::string& msg, MessagePtr failed = nullptr)
        : common::ConduitException(msg), _failed_message(std::move(failed))
    {
    }

    const MessagePtr& failed_message() const
    {
      return _failed_message;
    }

  private:
    MessagePtr _failed_message;
  };

  // Arguments could not be mapped to a message.
  struct MessageMappingException : MessagingException {

    MessageMappingException(const std::string& msg, MessagePtr failed = nullptr)
        : MessagingException(msg, std::move(failed))
    {
    }
  };

  // The channel did not accept the message.
  struct MessageDeliveryException : MessagingException {

    MessageDeliveryException(const std::string& msg, MessagePtr failed = nullptr)
        : MessagingException(msg, std::move(failed))
    {
    }
  };

  // The channel has no subscriber to dispatch the message to.
  struct MessageDispatchingException : MessageDeliveryException {

    MessageDispatchingException(const std::string& msg, MessagePtr failed = nullptr)
        : MessageDeliveryException(msg, std::move(failed))
    {
    }
  };

  // The downstream flow raised an exception while handling the message.
  struct MessageHandlingException : MessagingException {

    MessageHandlingException(const std::string& msg, MessagePtr failed = nullptr)
        : MessagingException(msg, std::move(failed))
    {
    }
  };

  struct ReplyTimeoutException : MessagingException {

    ReplyTimeoutException(const std::string& msg, MessagePtr failed = nullptr)
        : MessagingException(msg, std::move(failed))
    {
    }
  };

  struct ConnectionLostException : MessagingException {

    ConnectionLostException(const std::string& msg) : MessagingException(msg) {}
  };

} // namespace conduit::messaging

#endif
