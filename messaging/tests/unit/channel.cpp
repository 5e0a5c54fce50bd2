#include <conduit/common/exceptions.hpp>
#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/exceptions.hpp>

#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace conduit::messaging;

MessagePtr make_message(int payload)
{
  return MessageBuilder::with_payload(payload).build();
}

TEST(Channel, DirectRoundRobin)
{
  DirectChannel channel{"direct"};
  EXPECT_THROW(channel.send(make_message(0)), MessageDispatchingException);

  std::vector<int> first, second;
  channel.subscribe([&](const MessagePtr& msg) { first.push_back(*msg->payload_as<int>()); });
  channel.subscribe([&](const MessagePtr& msg) { second.push_back(*msg->payload_as<int>()); });
  EXPECT_EQ(channel.subscribers(), 2);

  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(channel.send(make_message(i)));
  }

  EXPECT_THAT(first, testing::ElementsAre(0, 2));
  EXPECT_THAT(second, testing::ElementsAre(1, 3));
}

TEST(Channel, DirectWrapsFailures)
{
  DirectChannel channel{"direct"};
  channel.subscribe([](const MessagePtr&) { throw std::invalid_argument{"bad"}; });

  auto msg = make_message(1);
  try {
    channel.send(msg);
    FAIL() << "Send should have failed";
  } catch (const MessageHandlingException& exc) {
    EXPECT_EQ(exc.failed_message(), msg);
    EXPECT_THROW(std::rethrow_if_nested(exc), std::invalid_argument);
  }

  DirectChannel rejecting{"rejecting"};
  rejecting.subscribe([](const MessagePtr& msg) {
    throw MessageDeliveryException{"rejected", msg};
  });
  EXPECT_THROW(rejecting.send(msg), MessageDeliveryException);
}

TEST(Channel, ExecutorPublishesFailures)
{
  auto executor = std::make_shared<ThreadPoolExecutor>(1);
  auto default_errors = std::make_shared<QueueChannel>("default-errors");
  ExecutorChannel channel{"executor", executor, default_errors};
  channel.subscribe([](const MessagePtr&) { throw std::runtime_error{"failure"}; });

  // Error channel of the message takes precedence.
  auto errors = std::make_shared<QueueChannel>("errors");
  EXPECT_TRUE(channel.send(MessageBuilder::with_payload(1).error_channel(errors).build()));
  auto error = errors->receive(std::chrono::milliseconds{1000});
  ASSERT_NE(error, nullptr);
  EXPECT_TRUE(error->is_error());

  EXPECT_TRUE(channel.send(make_message(2)));
  error = default_errors->receive(std::chrono::milliseconds{1000});
  ASSERT_NE(error, nullptr);
  EXPECT_TRUE(error->is_error());
  EXPECT_THROW(std::rethrow_exception(error->error()), MessageHandlingException);

  executor->wait();
}

TEST(Channel, Queue)
{
  QueueChannel channel{"queue", 1};

  EXPECT_EQ(channel.receive(std::chrono::milliseconds{10}), nullptr);

  EXPECT_TRUE(channel.send(make_message(1)));
  EXPECT_FALSE(channel.send(make_message(2), std::chrono::milliseconds{10}));
  EXPECT_EQ(channel.size(), 1);

  std::thread producer{[&channel]() { channel.send(make_message(3)); }};
  auto msg = channel.receive();
  producer.join();

  ASSERT_NE(msg, nullptr);
  EXPECT_EQ(*msg->payload_as<int>(), 1);
  msg = channel.receive(std::chrono::milliseconds{1000});
  ASSERT_NE(msg, nullptr);
  EXPECT_EQ(*msg->payload_as<int>(), 3);
}

TEST(Channel, Resolver)
{
  ChannelResolver resolver;
  auto channel = std::make_shared<DirectChannel>("direct");

  EXPECT_NO_THROW(resolver.add(channel));
  EXPECT_THROW(resolver.add(std::make_shared<QueueChannel>("direct")), conduit::common::ObjectExists);

  EXPECT_TRUE(resolver.contains("direct"));
  EXPECT_EQ(resolver.resolve("direct"), channel);
  EXPECT_THROW(resolver.resolve("other"), conduit::common::ObjectDoesNotExist);
}
