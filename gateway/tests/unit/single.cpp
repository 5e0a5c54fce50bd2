#include <conduit/gateway/gateway.hpp>
#include <conduit/messaging/exceptions.hpp>

#include "../mocks.hpp"

#include <atomic>

#include <gtest/gtest.h>

class SingleTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    direct = std::make_shared<messaging::DirectChannel>("direct");
    direct->subscribe([this](const messaging::MessagePtr& msg) {
      ++sent;
      int value = *msg->payload_as<int>();
      if (value < 0) {
        throw RuntimeCause{"negative"};
      }
      if (value > 0) {
        reply_with(msg, value + sent.load() * 100);
      }
    });
    channels.add(direct);
  }

  messaging::ChannelResolver channels;
  std::shared_ptr<messaging::DirectChannel> direct;
  std::atomic<int> sent{0};
};

TEST_F(SingleTest, LazySubscription)
{
  auto gw = GatewayFactory{gateway_config(), channels}
                .method<Single<int>(int)>("call", method_config("direct", 10))
                .build();
  EXPECT_EQ(gw.method("call").strategy, CompletionStrategy::LAZY_SINGLE);

  auto single = gw.invoker<Single<int>(int)>("call")(1);
  ASSERT_TRUE(single.valid());
  EXPECT_EQ(sent.load(), 0);

  // Every subscription is one more request.
  EXPECT_EQ(single.block(), 101);
  EXPECT_EQ(sent.load(), 1);
  EXPECT_EQ(single.block(), 201);
  EXPECT_EQ(sent.load(), 2);
}

TEST_F(SingleTest, Signals)
{
  auto gw = GatewayFactory{gateway_config(), channels}
                .method<Single<int>(int)>("call", method_config("direct", 10))
                .build();
  auto call = gw.invoker<Single<int>(int)>("call");

  // No reply completes empty.
  bool empty = false;
  call(0).subscribe(
      [](int) { FAIL() << "Unexpected value"; }, [](std::exception_ptr) { FAIL() << "Unexpected error"; },
      [&empty]() { empty = true; }
  );
  EXPECT_TRUE(empty);
  EXPECT_EQ(call(0).block(), std::nullopt);

  std::exception_ptr error;
  call(-1).subscribe([](int) {}, [&error](std::exception_ptr exc) { error = exc; });
  ASSERT_NE(error, nullptr);
  EXPECT_THROW(std::rethrow_exception(error), RuntimeCause);
  EXPECT_THROW(call(-1).block(), RuntimeCause);
}

TEST_F(SingleTest, SubscribeOnExecutor)
{
  auto gw = GatewayFactory{gateway_config(), channels}
                .method<Single<int>(int)>("call", method_config("direct", 10))
                .build();
  auto executor = std::make_shared<ManualExecutor>();

  auto single = gw.invoker<Single<int>(int)>("call")(2).subscribe_on(executor);

  std::optional<int> result;
  single.subscribe([&result](int value) { result = value; }, [](std::exception_ptr) {});
  EXPECT_EQ(sent.load(), 0);

  executor->run();
  EXPECT_EQ(sent.load(), 1);
  EXPECT_EQ(result, 102);
}

TEST(Single, Helpers)
{
  EXPECT_EQ(Single<int>::just(5).block(), 5);
  EXPECT_EQ(Single<int>::empty().block(), std::nullopt);

  Subscription subscription;
  EXPECT_FALSE(subscription.is_cancelled());
  subscription.cancel();
  EXPECT_TRUE(subscription.is_cancelled());
}

TEST(Single, WithoutSource)
{
  Single<int> single;
  EXPECT_FALSE(single.valid());

  bool signalled = false;
  EXPECT_THROW(
      single.subscribe(
          [&signalled](int) { signalled = true; }, [&signalled](std::exception_ptr) { signalled = true; }
      ),
      common::InvalidConfigurationError
  );
  EXPECT_FALSE(signalled);

  auto executor = std::make_shared<ManualExecutor>();
  auto scheduled = single.subscribe_on(executor);
  EXPECT_FALSE(scheduled.valid());
  EXPECT_THROW(scheduled.block(), common::InvalidConfigurationError);
  EXPECT_EQ(executor->pending(), 0);
}
