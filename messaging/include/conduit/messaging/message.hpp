#ifndef CONDUIT_MESSAGING_MESSAGE_HPP
#define CONDUIT_MESSAGING_MESSAGE_HPP

#include <any>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace conduit::messaging {

  struct Message;
  struct MessageChannel;

  using MessagePtr = std::shared_ptr<const Message>;
  using ChannelPtr = std::shared_ptr<MessageChannel>;
  using Headers = std::unordered_map<std::string, std::any>;

  namespace headers {

    constexpr char ID[] = "id";
    constexpr char TIMESTAMP[] = "timestamp";
    constexpr char CORRELATION_ID[] = "correlation-id";
    // Values are ChannelPtr.
    constexpr char REPLY_CHANNEL[] = "reply-channel";
    constexpr char ERROR_CHANNEL[] = "error-channel";
    constexpr char DESTINATION[] = "destination";
    constexpr char RECEIPT[] = "receipt";

  } // namespace headers

  /**
   * Immutable unit carried by channels: a payload and a header mapping.
   *
   * A payload of type std::exception_ptr marks the message as an error indicator;
   * receivers of such a reply treat it as a failure of the downstream flow.
   */
  struct Message {

    Message(std::any payload, Headers headers);

    Message(const Message&) = delete;
    Message& operator=(const Message&) = delete;

    const std::any& payload() const
    {
      return _payload;
    }

    bool has_payload() const
    {
      return _payload.has_value();
    }

    template <typename T>
    const T* payload_as() const
    {
      return std::any_cast<T>(&_payload);
    }

    const Headers& headers() const
    {
      return _headers;
    }

    bool has_header(const std::string& name) const;

    template <typename T>
    std::optional<T> header(const std::string& name) const
    {
      auto it = _headers.find(name);
      if (it == _headers.end()) {
        return std::nullopt;
      }
      const T* ptr = std::any_cast<T>(&(*it).second);
      if (!ptr) {
        return std::nullopt;
      }
      return *ptr;
    }

    std::string_view id() const
    {
      return _id;
    }

    std::chrono::system_clock::time_point timestamp() const
    {
      return _timestamp;
    }

    bool is_error() const;

    std::exception_ptr error() const;

    ChannelPtr reply_channel() const;

    ChannelPtr error_channel() const;

  private:
    std::string _id;
    std::chrono::system_clock::time_point _timestamp;
    std::any _payload;
    Headers _headers;
  };

  struct MessageBuilder {

    static MessageBuilder with_payload(std::any payload);

    // Copies payload and headers; the new message receives a new id.
    static MessageBuilder from_message(const Message& msg);

    // Error-indicator reply. Correlation and reply headers of the original are kept.
    static MessageBuilder error(std::exception_ptr exc, const MessagePtr& original = nullptr);

    MessageBuilder& header(const std::string& name, std::any value);

    MessageBuilder& header_if_absent(const std::string& name, std::any value);

    MessageBuilder& headers(const Headers& values);

    MessageBuilder& remove_header(const std::string& name);

    MessageBuilder& reply_channel(ChannelPtr channel);

    MessageBuilder& error_channel(ChannelPtr channel);

    MessageBuilder& payload(std::any payload);

    MessagePtr build();

  private:
    MessageBuilder(std::any payload) : _payload(std::move(payload)) {}

    std::any _payload;
    Headers _headers;
  };

} // namespace conduit::messaging

#endif
