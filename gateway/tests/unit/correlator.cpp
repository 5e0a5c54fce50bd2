#include <conduit/common/exceptions.hpp>
#include <conduit/gateway/correlator.hpp>

#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

using namespace conduit;
using namespace conduit::gateway;

messaging::MessagePtr make_reply(int value)
{
  return messaging::MessageBuilder::with_payload(value).build();
}

TEST(ReplySlot, FirstWriterWins)
{
  ReplySlot slot;
  EXPECT_EQ(slot.state(), ReplySlot::State::EMPTY);

  auto reply = make_reply(1);
  EXPECT_TRUE(slot.fill(reply));
  EXPECT_FALSE(slot.fill(make_reply(2)));
  EXPECT_FALSE(slot.fail(std::make_exception_ptr(std::runtime_error{"late"})));

  EXPECT_EQ(slot.await(std::chrono::milliseconds{0}), ReplySlot::State::VALUE);
  EXPECT_EQ(slot.reply(), reply);
  EXPECT_EQ(slot.error(), nullptr);
}

TEST(ReplySlot, Expiry)
{
  ReplySlot slot;

  auto begin = std::chrono::steady_clock::now();
  EXPECT_EQ(slot.await(std::chrono::milliseconds{50}), ReplySlot::State::EXPIRED);
  EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds{50});

  EXPECT_FALSE(slot.fill(make_reply(1)));
  EXPECT_EQ(slot.state(), ReplySlot::State::EXPIRED);
  EXPECT_EQ(slot.reply(), nullptr);
}

TEST(PendingRegistry, InsertResolve)
{
  PendingRegistry registry;

  auto slot = registry.insert("first");
  EXPECT_THROW(registry.insert("first"), common::ObjectExists);
  EXPECT_TRUE(registry.contains("first"));
  EXPECT_EQ(registry.size(), 1);

  EXPECT_TRUE(registry.resolve("first", make_reply(1)));
  EXPECT_FALSE(registry.contains("first"));
  EXPECT_EQ(slot->state(), ReplySlot::State::VALUE);

  EXPECT_FALSE(registry.resolve("first", make_reply(2)));
  EXPECT_FALSE(registry.fail("unknown", std::make_exception_ptr(std::runtime_error{"error"})));

  registry.insert("second");
  EXPECT_TRUE(registry.remove("second"));
  EXPECT_FALSE(registry.remove("second"));
  EXPECT_EQ(registry.size(), 0);
}

TEST(ReplyCorrelator, ResolveFromAnotherThread)
{
  ReplyCorrelator correlator{std::make_shared<PendingRegistry>()};

  auto correlation = correlator.open();
  EXPECT_TRUE(correlator.registry()->contains(correlation.id));

  std::thread producer{[&correlator, id = correlation.id]() {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    correlator.resolve(id, make_reply(42));
  }};

  auto begin = std::chrono::steady_clock::now();
  auto reply = correlator.await(correlation, std::nullopt);
  auto end = std::chrono::steady_clock::now();
  producer.join();

  ASSERT_NE(reply, nullptr);
  EXPECT_EQ(*reply->payload_as<int>(), 42);
  EXPECT_GE(end - begin, std::chrono::milliseconds{50});
  EXPECT_FALSE(correlator.registry()->contains(correlation.id));
}

TEST(ReplyCorrelator, LateResolveIsHarmless)
{
  ReplyCorrelator correlator{std::make_shared<PendingRegistry>()};

  auto correlation = correlator.open();
  EXPECT_EQ(correlator.await(correlation, std::chrono::milliseconds{20}), nullptr);
  EXPECT_FALSE(correlator.registry()->contains(correlation.id));

  EXPECT_FALSE(correlator.resolve(correlation.id, make_reply(1)));
  EXPECT_NO_THROW(correlation.reply_channel->send(make_reply(2)));
  EXPECT_EQ(correlation.slot->state(), ReplySlot::State::EXPIRED);
}

TEST(ReplyCorrelator, Failure)
{
  ReplyCorrelator correlator{std::make_shared<PendingRegistry>()};

  auto correlation = correlator.open();
  auto error = messaging::MessageBuilder::error(std::make_exception_ptr(std::invalid_argument{"bad"}))
                   .build();
  EXPECT_TRUE(correlation.reply_channel->send(error));

  EXPECT_THROW(correlator.await(correlation, std::chrono::milliseconds{1000}), std::invalid_argument);
}

TEST(ReplyCorrelator, Release)
{
  ReplyCorrelator correlator{std::make_shared<PendingRegistry>()};

  auto correlation = correlator.open();
  correlator.release(correlation);
  EXPECT_FALSE(correlator.registry()->contains(correlation.id));
  EXPECT_NO_THROW(correlator.release(correlation));
}
