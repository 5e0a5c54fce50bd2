#include <conduit/gateway/gateway.hpp>
#include <conduit/messaging/exceptions.hpp>

#include "../mocks.hpp"

#include <atomic>
#include <future>
#include <thread>

#include <gtest/gtest.h>

class AsyncTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    direct = std::make_shared<messaging::DirectChannel>("direct");
    channels.add(direct);

    gate_future = gate.get_future().share();
  }

  // Downstream flow replying only after the gate opens.
  void gated_echo()
  {
    direct->subscribe([gate = gate_future](const messaging::MessagePtr& msg) {
      gate.wait();
      reply_with(msg, msg->payload());
    });
  }

  messaging::ChannelResolver channels;
  std::shared_ptr<messaging::DirectChannel> direct;

  std::promise<void> gate;
  std::shared_future<void> gate_future;
};

// Handle type that the executor cannot complete.
class CustomFuture : public CompletableFuture<int> {
public:
  CustomFuture() = default;
  CustomFuture(CompletableFuture<int> future) : CompletableFuture<int>(std::move(future)) {}
};

TEST_F(AsyncTest, EagerCompletable)
{
  gated_echo();

  auto gw = GatewayFactory{gateway_config(), channels}
                .method<CompletableFuture<int>(int)>("call", method_config("direct"))
                .build();
  EXPECT_EQ(gw.method("call").strategy, CompletionStrategy::EAGER_COMPLETABLE);

  auto future = gw.invoker<CompletableFuture<int>(int)>("call")(42);
  ASSERT_TRUE(future.valid());
  EXPECT_FALSE(future.is_done());

  gate.set_value();
  EXPECT_EQ(future.get(), 42);
  EXPECT_FALSE(future.is_completed_exceptionally());
}

TEST_F(AsyncTest, ExecutorFuture)
{
  gated_echo();

  auto gw = GatewayFactory{gateway_config(), channels}
                .method<std::future<int>(int)>("call", method_config("direct"))
                .build();
  EXPECT_EQ(gw.method("call").strategy, CompletionStrategy::EXECUTOR_FUTURE);

  auto future = gw.invoker<std::future<int>(int)>("call")(7);
  EXPECT_EQ(future.wait_for(std::chrono::milliseconds{20}), std::future_status::timeout);

  gate.set_value();
  EXPECT_EQ(future.get(), 7);
}

TEST_F(AsyncTest, ExecutorFutureFailure)
{
  direct->subscribe([](const messaging::MessagePtr&) { throw RuntimeCause{"failed"}; });

  auto gw = GatewayFactory{gateway_config(), channels}
                .method<std::future<void>(int)>("call", method_config("direct"))
                .build();

  auto future = gw.invoker<std::future<void>(int)>("call")(1);
  EXPECT_THROW(future.get(), RuntimeCause);
}

TEST_F(AsyncTest, Listenable)
{
  direct->subscribe(echo());

  auto executor = std::make_shared<ManualExecutor>();
  auto gw = GatewayFactory{gateway_config(), channels}
                .method<ListenableFuture<int>(int)>("call", method_config("direct"))
                .executor(executor)
                .build();
  EXPECT_EQ(gw.method("call").strategy, CompletionStrategy::LISTENABLE_FUTURE);

  auto call = gw.invoker<ListenableFuture<int>(int)>("call");

  std::optional<int> result;
  auto future = call(3);
  future.add_callback([&result](const int& value) { result = value; }, [](std::exception_ptr) {});
  EXPECT_FALSE(result.has_value());

  executor->run();
  EXPECT_EQ(result, 3);
  EXPECT_EQ(future.get(), 3);

  // Cancelled before the task starts: nothing is sent.
  std::atomic<int> sent{0};
  direct->subscribe([&sent](const messaging::MessagePtr& msg) {
    ++sent;
    reply_with(msg, msg->payload());
  });
  auto second = call(4);
  auto third = call(5);
  EXPECT_TRUE(second.cancel());
  EXPECT_TRUE(third.cancel());
  executor->run();

  EXPECT_TRUE(second.is_cancelled());
  EXPECT_THROW(second.get(), CancellationError);
  EXPECT_EQ(sent.load(), 0);
}

TEST_F(AsyncTest, DeferredCompletable)
{
  auto handle = CompletableFuture<int>::create();
  std::thread::id handler_thread;
  direct->subscribe([&handle, &handler_thread](const messaging::MessagePtr& msg) {
    handler_thread = std::this_thread::get_id();
    reply_with(msg, handle);
  });

  auto cfg = method_config("direct");
  cfg.async_executor = false;
  auto gw = GatewayFactory{gateway_config(), channels}
                .method<CompletableFuture<int>(int)>("call", cfg)
                .build();
  EXPECT_EQ(gw.method("call").strategy, CompletionStrategy::DEFERRED_COMPLETABLE);

  auto future = gw.invoker<CompletableFuture<int>(int)>("call")(1);
  EXPECT_EQ(handler_thread, std::this_thread::get_id());
  EXPECT_FALSE(future.is_done());

  handle.complete(11);
  EXPECT_EQ(future.get(), 11);
}

TEST_F(AsyncTest, CompletableSubtype)
{
  CustomFuture handle{CompletableFuture<int>::create()};
  direct->subscribe([&handle](const messaging::MessagePtr& msg) { reply_with(msg, handle); });

  auto gw = GatewayFactory{gateway_config(), channels}
                .method<CustomFuture(int)>("call", method_config("direct"))
                .build();
  EXPECT_EQ(gw.method("call").metadata.return_kind, ReturnKind::COMPLETABLE_FUTURE_SUBTYPE);
  EXPECT_EQ(gw.method("call").strategy, CompletionStrategy::DEFERRED_COMPLETABLE);

  auto future = gw.invoker<CustomFuture(int)>("call")(1);
  handle.complete(5);
  EXPECT_EQ(future.get(), 5);
}

TEST_F(AsyncTest, DeferredWithoutReply)
{
  auto queue = std::make_shared<messaging::QueueChannel>("queue");
  channels.add(queue);

  auto cfg = method_config("queue", 10);
  cfg.async_executor = false;
  auto gw = GatewayFactory{gateway_config(), channels}
                .method<CompletableFuture<int>(int)>("call", cfg)
                .build();

  auto future = gw.invoker<CompletableFuture<int>(int)>("call")(1);
  EXPECT_FALSE(future.valid());
}

TEST_F(AsyncTest, UnsupportedReturnType)
{
  EXPECT_THROW(
      GatewayFactory(gateway_config(false), channels)
          .method<std::future<int>(int)>("call", method_config("direct"))
          .build(),
      UnsupportedReturnTypeError
  );

  auto executor = std::make_shared<testing::NiceMock<MockExecutor>>();
  ON_CALL(*executor, supports_listenable()).WillByDefault(testing::Return(false));
  EXPECT_THROW(
      GatewayFactory(gateway_config(false), channels)
          .method<ListenableFuture<int>(int)>("call", method_config("direct"))
          .executor(executor)
          .build(),
      UnsupportedReturnTypeError
  );

  auto cfg = method_config("direct");
  cfg.async_executor = false;
  EXPECT_THROW(
      GatewayFactory(gateway_config(), channels).method<std::future<int>(int)>("call", cfg).build(),
      UnsupportedReturnTypeError
  );
}
