#include <conduit/messaging/message.hpp>

#include <conduit/common/uuid.hpp>
#include <conduit/messaging/channel.hpp>

namespace conduit::messaging {

  Message::Message(std::any payload, Headers headers)
      : _id(common::UUID::next()), _timestamp(std::chrono::system_clock::now()),
        _payload(std::move(payload)), _headers(std::move(headers))
  {
  }

  bool Message::has_header(const std::string& name) const
  {
    return _headers.find(name) != _headers.end();
  }

  bool Message::is_error() const
  {
    return _payload.type() == typeid(std::exception_ptr);
  }

  std::exception_ptr Message::error() const
  {
    const auto* ptr = std::any_cast<std::exception_ptr>(&_payload);
    return ptr ? *ptr : nullptr;
  }

  ChannelPtr Message::reply_channel() const
  {
    return header<ChannelPtr>(headers::REPLY_CHANNEL).value_or(nullptr);
  }

  ChannelPtr Message::error_channel() const
  {
    return header<ChannelPtr>(headers::ERROR_CHANNEL).value_or(nullptr);
  }

  MessageBuilder MessageBuilder::with_payload(std::any payload)
  {
    return MessageBuilder{std::move(payload)};
  }

  MessageBuilder MessageBuilder::from_message(const Message& msg)
  {
    MessageBuilder builder{msg.payload()};
    builder._headers = msg.headers();
    return builder;
  }

  MessageBuilder MessageBuilder::error(std::exception_ptr exc, const MessagePtr& original)
  {
    MessageBuilder builder{std::any{std::move(exc)}};
    if (original) {
      for (const char* name : {headers::CORRELATION_ID, headers::REPLY_CHANNEL, headers::ERROR_CHANNEL}) {
        auto it = original->headers().find(name);
        if (it != original->headers().end()) {
          builder._headers.emplace(name, (*it).second);
        }
      }
    }
    return builder;
  }

  MessageBuilder& MessageBuilder::header(const std::string& name, std::any value)
  {
    _headers.insert_or_assign(name, std::move(value));
    return *this;
  }

  MessageBuilder& MessageBuilder::header_if_absent(const std::string& name, std::any value)
  {
    _headers.try_emplace(name, std::move(value));
    return *this;
  }

  MessageBuilder& MessageBuilder::headers(const Headers& values)
  {
    for (const auto& [name, value] : values) {
      _headers.insert_or_assign(name, value);
    }
    return *this;
  }

  MessageBuilder& MessageBuilder::remove_header(const std::string& name)
  {
    _headers.erase(name);
    return *this;
  }

  MessageBuilder& MessageBuilder::reply_channel(ChannelPtr channel)
  {
    return header(headers::REPLY_CHANNEL, std::move(channel));
  }

  MessageBuilder& MessageBuilder::error_channel(ChannelPtr channel)
  {
    return header(headers::ERROR_CHANNEL, std::move(channel));
  }

  MessageBuilder& MessageBuilder::payload(std::any payload)
  {
    _payload = std::move(payload);
    return *this;
  }

  MessagePtr MessageBuilder::build()
  {
    _headers.erase(headers::ID);
    _headers.erase(headers::TIMESTAMP);
    return std::make_shared<const Message>(std::move(_payload), std::move(_headers));
  }

} // namespace conduit::messaging
