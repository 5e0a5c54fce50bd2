#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/exceptions.hpp>
#include <conduit/messaging/message.hpp>

#include <stdexcept>

#include <gtest/gtest.h>

using namespace conduit::messaging;

TEST(Message, Build)
{
  auto msg = MessageBuilder::with_payload(std::string{"payload"})
                 .header("key", std::string{"value"})
                 .header("number", 5)
                 .build();

  ASSERT_NE(msg->payload_as<std::string>(), nullptr);
  EXPECT_EQ(*msg->payload_as<std::string>(), "payload");
  EXPECT_EQ(msg->payload_as<int>(), nullptr);

  EXPECT_EQ(msg->header<std::string>("key"), "value");
  EXPECT_EQ(msg->header<int>("number"), 5);
  EXPECT_FALSE(msg->header<int>("key").has_value());
  EXPECT_FALSE(msg->header<int>("missing").has_value());

  EXPECT_FALSE(msg->id().empty());
  EXPECT_FALSE(msg->is_error());
  EXPECT_EQ(msg->error(), nullptr);
  EXPECT_EQ(msg->reply_channel(), nullptr);
}

TEST(Message, CopyFromMessage)
{
  auto channel = std::make_shared<QueueChannel>("replies");
  auto msg = MessageBuilder::with_payload(1).header("key", 2).reply_channel(channel).build();

  auto copy = MessageBuilder::from_message(*msg).header_if_absent("key", 3).remove_header("other").build();

  EXPECT_NE(copy->id(), msg->id());
  EXPECT_EQ(*copy->payload_as<int>(), 1);
  EXPECT_EQ(copy->header<int>("key"), 2);
  EXPECT_EQ(copy->reply_channel(), channel);
}

TEST(Message, ErrorMessage)
{
  auto replies = std::make_shared<QueueChannel>("replies");
  auto errors = std::make_shared<QueueChannel>("errors");
  auto original = MessageBuilder::with_payload(1)
                      .reply_channel(replies)
                      .error_channel(errors)
                      .header(headers::CORRELATION_ID, std::string{"id"})
                      .header("other", 1)
                      .build();

  auto error = MessageBuilder::error(std::make_exception_ptr(std::runtime_error{"failure"}), original)
                   .build();

  EXPECT_TRUE(error->is_error());
  ASSERT_NE(error->error(), nullptr);
  EXPECT_THROW(std::rethrow_exception(error->error()), std::runtime_error);

  EXPECT_EQ(error->reply_channel(), replies);
  EXPECT_EQ(error->error_channel(), errors);
  EXPECT_EQ(error->header<std::string>(headers::CORRELATION_ID), "id");
  EXPECT_FALSE(error->has_header("other"));
}
